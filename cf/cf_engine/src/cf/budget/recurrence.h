#pragma once

#include "cf/budget/defs.h"
#include "cf/cal/bank_day_adjuster.h"

#include <boost/variant.hpp>

#include <iosfwd>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
using util::weekday_t;
using cal::adjustment_policy;

//............................................................................
// recurrence variants (each carries only the fields meaningful to it):
//............................................................................

struct once final
{
    adjustment_policy m_adjustment { };

}; // end of class

struct daily final
{
    int32_t m_interval { 1 };
    adjustment_policy m_adjustment { };

}; // end of class

struct weekly final
{
    weekday_t m_weekday { gd::Monday };
    int32_t m_interval { 1 };
    adjustment_policy m_adjustment { };

}; // end of class

/**
 * 'm_day_of_month' past the end of a candidate month is clamped to that month's last day
 */
struct monthly_fixed final
{
    int32_t m_day_of_month { 1 };
    int32_t m_interval { 1 };
    adjustment_policy m_adjustment { };

}; // end of class

struct monthly_relative final
{
    weekday_t m_weekday { gd::Monday };
    relative_position::enum_t m_position { relative_position::first };
    int32_t m_interval { 1 };
    adjustment_policy m_adjustment { };

}; // end of class

/**
 * never adjusted: the candidate is a bank day by construction
 */
struct monthly_bank_day final
{
    int32_t m_bank_day_number { 1 };
    bool m_from_end { false };
    int32_t m_interval { 1 };

}; // end of class

//............................................................................

struct fixed_day final
{
    int32_t m_day_of_month { 1 };

}; // end of class

struct relative_day final
{
    relative_position::enum_t m_position { relative_position::first };
    weekday_t m_weekday { gd::Monday };

}; // end of class

using yearly_anchor         = boost::variant<fixed_day, relative_day>;

struct yearly final
{
    int32_t m_month { 1 };
    yearly_anchor m_anchor { fixed_day { } };
    int32_t m_interval { 1 };
    adjustment_policy m_adjustment { };

}; // end of class

struct yearly_bank_day final
{
    int32_t m_month { 1 };
    int32_t m_bank_day_number { 1 };
    bool m_from_end { false };
    int32_t m_interval { 1 };

}; // end of class

//............................................................................

struct period_once final
{
}; // end of class

struct period_monthly final
{
    int32_t m_interval { 1 };

}; // end of class

struct period_yearly final
{
    std::vector<int32_t> m_months { };
    int32_t m_interval { 1 };

}; // end of class

//............................................................................

/*
 * note: type order must match that of 'recurrence_type' values
 */
using recurrence_pattern    = boost::variant
<
    once,
    daily,
    weekly,
    monthly_fixed,
    monthly_relative,
    monthly_bank_day,
    yearly,
    yearly_bank_day,
    period_once,
    period_monthly,
    period_yearly
>;

#define CF_RECURRENCE_TYPE_SEQ  \
        (once)                  \
        (daily)                 \
        (weekly)                \
        (monthly_fixed)         \
        (monthly_relative)      \
        (monthly_bank_day)      \
        (yearly)                \
        (yearly_bank_day)       \
        (period_once)           \
        (period_monthly)        \
        (period_yearly)         \
    /* */

CF_ENUM (recurrence_type,
    (
        BOOST_PP_SEQ_ENUM (CF_RECURRENCE_TYPE_SEQ)
    ),
    iterable, printable, parsable

); // end of enum

//............................................................................

inline recurrence_type::enum_t
type_of (recurrence_pattern const & r)
{
    return static_cast<recurrence_type::enum_t> (r.which ());
}

/**
 * @return 'true' for the 'period_*' variants (whole-month occurrences)
 */
inline bool
is_period (recurrence_pattern const & r)
{
    switch (type_of (r))
    {
        case recurrence_type::period_once:
        case recurrence_type::period_monthly:
        case recurrence_type::period_yearly: return true;

        default: return false;

    } // end of switch
}

/**
 * @return 'false' for the variants that produce at most one occurrence ever
 */
inline bool
is_repeating (recurrence_pattern const & r)
{
    switch (type_of (r))
    {
        case recurrence_type::once:
        case recurrence_type::period_once: return false;

        default: return true;

    } // end of switch
}

/**
 * @return the bank day adjustment policy carried by 'r' (a default, i.e. 'none',
 *         policy for the variants that don't carry one)
 */
extern adjustment_policy
adjustment_of (recurrence_pattern const & r);

/**
 * @throws malformed_pattern on an out-of-range field value
 */
extern void
validate (recurrence_pattern const & r);

//............................................................................
// weekday encoding used on the wire and in config (0 = Monday, ..., 6 = Sunday):

extern weekday_t
weekday_from_index (int32_t const index);

extern int32_t
weekday_index (weekday_t const wd);

//............................................................................

#define cf_RECURRENCE_DECLARE_OPS(r, unused, type) \
    extern bool operator== (type const & lhs, type const & rhs); \
    inline bool operator!= (type const & lhs, type const & rhs) { return (! (lhs == rhs)); } \
    extern std::ostream & operator<< (std::ostream & os, type const & obj); \
    /* */

BOOST_PP_SEQ_FOR_EACH (cf_RECURRENCE_DECLARE_OPS, unused, CF_RECURRENCE_TYPE_SEQ (fixed_day)(relative_day))

#undef cf_RECURRENCE_DECLARE_OPS

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
