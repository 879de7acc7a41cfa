#pragma once

#include "cf/budget/recurrence.h"
#include "cf/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * one payment rule of a budget post
 *
 * for the non-repeating variants 'm_start_date' is the occurrence date; an unset
 * 'm_end_date' means the pattern repeats forever
 *
 * @see amount_pattern_builder
 */
struct amount_pattern final
{
    amount_t m_amount { };
    date_t m_start_date { };
    optional<date_t> m_end_date { };
    recurrence_pattern m_recurrence { };
    container_id_vector m_container_ids { };

    friend bool operator== (amount_pattern const & lhs, amount_pattern const & rhs)
    {
        return ((lhs.m_amount == rhs.m_amount) && (lhs.m_start_date == rhs.m_start_date) && (lhs.m_end_date == rhs.m_end_date)
             && (lhs.m_recurrence == rhs.m_recurrence) && (lhs.m_container_ids == rhs.m_container_ids));
    }

    friend std::ostream & operator<< (std::ostream & os, amount_pattern const & obj);

}; // end of class

using amount_pattern_vector     = std::vector<amount_pattern>;

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
