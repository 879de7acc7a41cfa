#pragma once

#include "cf/budget/budget_post.h"
#include "cf/budget/occurrence_generator.h"

#include <map>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
using container_balances    = std::map<container_id, amount_t>;

/**
 * all amounts are in minor units; 'm_expected_expenses' is a (non-negative for
 * ordinary posts) magnitude that is subtracted from the balance
 */
struct month_projection final
{
    month_index_t m_month { };
    amount_t m_start_balance { };
    amount_t m_expected_income { };
    amount_t m_expected_expenses { };
    amount_t m_end_balance { };
    container_balances m_container_balances { }; // end of month, per container

    friend std::ostream & operator<< (std::ostream & os, month_projection const & obj);

}; // end of class

struct large_expense final
{
    std::string m_name { };
    amount_t m_amount { };
    date_t m_date { };

    friend std::ostream & operator<< (std::ostream & os, large_expense const & obj);

}; // end of class

struct forecast_result final
{
    std::vector<month_projection> m_projections { };
    month_index_t m_lowest_month { };
    amount_t m_lowest_balance { };
    optional<large_expense> m_next_large_expense { };

}; // end of class
//............................................................................
/**
 * projects monthly balances over a horizon of consecutive months
 *
 * every month is expanded through @ref occurrence_generator, clipped to that month:
 *
 *  - income/expense occurrences go into the month's income/expense totals and move
 *    the balance of their pattern's first container (the post's first container if
 *    the pattern lists none);
 *  - transfer posts stay out of the totals but move money between their 'from' and
 *    'to' containers;
 *  - an accumulating expense post's carry-forward adjustment for the month is added
 *    to the month's expenses;
 *
 * 'lowest point' is the month with the minimum end balance (earliest on ties);
 * 'next large expense' is the earliest expense occurrence in the first
 * @ref large_expense_horizon() months with an amount exceeding the threshold
 */
class forecast_projector final
{
    public: // ...............................................................

        forecast_projector (cal::bank_day_oracle const & oracle, amount_t const large_expense_threshold);

        /**
         * @param months [must be positive]
         *
         * @throws invalid_input if 'months' < 1
         */
        forecast_result project (budget_post_vector const & posts, container_balances const & starting_balances, month_index_t const first_month, int32_t const months) const;

    private: // ..............................................................

        occurrence_generator const m_generator;
        amount_t const m_large_expense_threshold;

}; // end of class

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
