#pragma once

#include "cf/budget/defs.h"

#include <ostream>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * one concrete instance of an amount pattern; never persisted
 *
 * a 'period' occurrence stands for its whole month and is dated on the 1st
 */
struct occurrence final
{
    int32_t m_pattern_index { };
    date_t m_date { };
    amount_t m_amount { };
    occurrence_kind::enum_t m_kind { occurrence_kind::dated };

    friend bool operator== (occurrence const & lhs, occurrence const & rhs)
    {
        return ((lhs.m_pattern_index == rhs.m_pattern_index) && (lhs.m_date == rhs.m_date) && (lhs.m_amount == rhs.m_amount) && (lhs.m_kind == rhs.m_kind));
    }

    friend std::ostream & operator<< (std::ostream & os, occurrence const & obj)
    {
        return os << '{' << obj.m_pattern_index << ", " << util::print_date (obj.m_date) << ", " << obj.m_amount << ", " << obj.m_kind << '}';
    }

}; // end of class

using occurrence_vector     = std::vector<occurrence>;

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
