#pragma once

#include "cf/budget/amount_pattern.h"
#include "cf/types.h"

#include <map>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * a planned recurring income/expense/transfer item, owning its amount patterns
 *
 * income and expense posts draw from/deposit to 'm_container_ids'; transfer posts
 * instead move money from 'm_transfer_from' to 'm_transfer_to'
 */
struct budget_post final
{
    std::string m_id { };
    std::string m_name { };
    string_vector m_category_path { };          // root first
    direction::enum_t m_direction { direction::expense };
    bool m_accumulate { false };                // expense only
    container_id_vector m_container_ids { };
    container_id m_transfer_from { };
    container_id m_transfer_to { };
    amount_pattern_vector m_patterns { };
    std::map<month_index_t, amount_t> m_carry_forward { }; // honored only if 'm_accumulate'

    /**
     * @return 'm_name' if set, otherwise the last element of 'm_category_path'
     */
    std::string const & display_name () const;

    /**
     * @return pre-computed carry-forward adjustment for 'month' (zero unless this
     *         is an accumulating expense post)
     */
    amount_t carry_forward (month_index_t const month) const;

    friend std::ostream & operator<< (std::ostream & os, budget_post const & obj);

}; // end of class

using budget_post_vector    = std::vector<budget_post>;

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
