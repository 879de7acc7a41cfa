
#include "cf/budget/forecast_projector.h"

#include "cf/util/logging.h"

#include <ostream>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
//............................................................................
namespace
{

container_id const *
account_of (budget_post const & post, amount_pattern const & pattern)
{
    if (! pattern.m_container_ids.empty ())
        return & pattern.m_container_ids.front ();

    if (! post.m_container_ids.empty ())
        return & post.m_container_ids.front ();

    return nullptr;
}

inline void
credit (container_balances & balances, container_id const * const c, amount_t const amount)
{
    if (c) balances [* c] += amount;
}

} // end of anonymous
//............................................................................
//............................................................................

std::ostream &
operator<< (std::ostream & os, month_projection const & obj)
{
    return os << '{' << util::print_month (obj.m_month) << ": " << obj.m_start_balance << " + " << obj.m_expected_income << " - " << obj.m_expected_expenses << " = " << obj.m_end_balance << '}';
}

std::ostream &
operator<< (std::ostream & os, large_expense const & obj)
{
    return os << '{' << print (obj.m_name) << ", " << obj.m_amount << ", " << print (obj.m_date) << '}';
}
//............................................................................

forecast_projector::forecast_projector (cal::bank_day_oracle const & oracle, amount_t const large_expense_threshold) :
    m_generator { oracle },
    m_large_expense_threshold { large_expense_threshold }
{
}

forecast_result
forecast_projector::project (budget_post_vector const & posts, container_balances const & starting_balances, month_index_t const first_month, int32_t const months) const
{
    if (CF_UNLIKELY (months < 1))
        throw_x (invalid_input, "forecast horizon must be positive: " + string_cast (months));

    forecast_result r { };
    r.m_projections.reserve (months);

    container_balances balances { starting_balances };

    amount_t balance { };
    for (auto const & kv : starting_balances)
        balance += kv.second;

    occurrence_vector occurrences { };

    for (int32_t offset = 0; offset < months; ++ offset)
    {
        month_index_t const month = first_month + offset;

        date_t const month_start = util::month_start (month);
        date_t const month_end = util::month_end (month);

        month_projection mp { };
        mp.m_month = month;
        mp.m_start_balance = balance;

        for (budget_post const & post : posts)
        {
            for (int32_t p = 0, p_limit = post.m_patterns.size (); p < p_limit; ++ p)
            {
                amount_pattern const & pattern = post.m_patterns [p];

                occurrences.clear ();
                m_generator.generate (pattern, month_start, month_end, p, occurrences);

                for (occurrence const & o : occurrences)
                {
                    switch (post.m_direction)
                    {
                        case direction::income:
                        {
                            mp.m_expected_income += o.m_amount;
                            credit (balances, account_of (post, pattern), o.m_amount);
                        }
                        break;

                        case direction::expense:
                        {
                            mp.m_expected_expenses += o.m_amount;
                            credit (balances, account_of (post, pattern), - o.m_amount);

                            if ((offset < large_expense_horizon ()) && (o.m_amount > m_large_expense_threshold)
                                && (! r.m_next_large_expense || (o.m_date < r.m_next_large_expense->m_date)))
                            {
                                r.m_next_large_expense = large_expense { post.display_name (), o.m_amount, o.m_date };
                            }
                        }
                        break;

                        case direction::transfer:
                        {
                            if (! post.m_transfer_from.empty ()) balances [post.m_transfer_from] -= o.m_amount;
                            if (! post.m_transfer_to.empty ()) balances [post.m_transfer_to] += o.m_amount;
                        }
                        break;

                        default: CF_ASSUME_UNREACHABLE (post.m_direction);

                    } // end of switch
                }
            }

            amount_t const carry = post.carry_forward (month);
            if (carry)
            {
                mp.m_expected_expenses += carry;
                credit (balances, (post.m_container_ids.empty () ? nullptr : & post.m_container_ids.front ()), - carry);
            }
        }

        mp.m_end_balance = mp.m_start_balance + mp.m_expected_income - mp.m_expected_expenses;
        mp.m_container_balances = balances;

        balance = mp.m_end_balance;

        if ((offset == 0) || (mp.m_end_balance < r.m_lowest_balance))
        {
            r.m_lowest_month = month;
            r.m_lowest_balance = mp.m_end_balance;
        }

        DLOG_trace1 << mp;
        r.m_projections.push_back (std::move (mp));
    }

    LOG_trace1 << "projected " << posts.size () << " post(s) over " << months << " month(s) from " << util::print_month (first_month)
               << ", lowest point " << util::print_month (r.m_lowest_month) << ": " << r.m_lowest_balance;

    return r;
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
