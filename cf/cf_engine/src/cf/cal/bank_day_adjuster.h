#pragma once

#include "cf/cal/bank_day_oracle.h"
#include "cf/enums.h"
#include "cf/utility.h"

#include <iosfwd>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................

CF_ENUM (bank_day_adjustment,
    (
        none,
        next,
        previous
    ),
    iterable, printable, parsable

); // end of enum
//............................................................................
/**
 * how a computed date that falls on a non-bank day is to be moved
 *
 * 'm_no_dedup' is not used by @ref adjust_to_bank_day(): it tells the occurrence
 * generator to keep colliding adjusted dates as separate occurrences
 */
struct adjustment_policy final
{
    bank_day_adjustment::enum_t m_direction { bank_day_adjustment::none };
    bool m_keep_in_month { true };
    bool m_no_dedup { false };

    friend bool operator== (adjustment_policy const & lhs, adjustment_policy const & rhs)
    {
        return ((lhs.m_direction == rhs.m_direction) && (lhs.m_keep_in_month == rhs.m_keep_in_month) && (lhs.m_no_dedup == rhs.m_no_dedup));
    }

    friend std::ostream & operator<< (std::ostream & os, adjustment_policy const & obj);

}; // end of class
//............................................................................

/**
 * an upper bound on how far a single adjustment walk is allowed to go
 */
constexpr int32_t max_adjustment_walk ()    { return 366; }

/**
 * @return 'd' itself if it is a bank day or 'policy' is 'none'; otherwise the nearest bank
 *         day in the policy direction (reversing direction from 'd' if 'keep_in_month' is set
 *         and the first walk would leave the month of 'd')
 *
 * @throws illegal_state if no bank day is found within @ref max_adjustment_walk() days
 */
extern date_t
adjust_to_bank_day (date_t const & d, adjustment_policy const & policy, bank_day_oracle const & oracle);

/**
 * @param n [positive]
 * @return 'n'-th bank day of the month (counting from the end if 'from_end'), unset if
 *         the month has fewer than 'n' bank days
 */
extern optional<date_t>
nth_bank_day (int32_t const year, int32_t const month, int32_t const n, bool const from_end, bank_day_oracle const & oracle);

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
