#pragma once

#include "cf/asserts.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

//----------------------------------------------------------------------------
namespace cf
{
namespace pt        = boost::posix_time;
namespace gd        = boost::gregorian;

namespace util
{
//............................................................................

using date_t                = gd::date;
using date_duration_t       = gd::date_duration;
using weekday_t             = gd::greg_weekday;
using ptime_t               = pt::ptime;

using day_iterator          = gd::day_iterator;

/**
 * a month identified by 'year * 12 + (month - 1)', convenient for month arithmetic
 */
using month_index_t         = int32_t;

//............................................................................

inline month_index_t
month_index (call_traits<date_t>::param date)
{
    return (date.year () * 12 + (date.month () - 1));
}

inline month_index_t
month_index (int32_t const year, int32_t const month)
{
    return (year * 12 + (month - 1));
}

inline int32_t
month_year (month_index_t const mi)
{
    return (mi / 12);
}

/**
 * @return month in [1, 12]
 */
inline int32_t
month_of (month_index_t const mi)
{
    return (mi % 12 + 1);
}

inline int32_t
days_in_month (int32_t const year, int32_t const month)
{
    return gd::gregorian_calendar::end_of_month_day (year, month);
}

inline date_t
month_start (month_index_t const mi)
{
    return { static_cast<uint16_t> (month_year (mi)), static_cast<uint16_t> (month_of (mi)), 1 };
}

inline date_t
month_end (month_index_t const mi)
{
    return month_start (mi).end_of_month ();
}

//............................................................................

extern void
format_date (call_traits<date_t>::param date, std::string const & format, std::ostream & os);

inline std::string
format_date (call_traits<date_t>::param date, std::string const & format)
{
    std::stringstream ss { };
    format_date (date, format, ss);

    return ss.str ();
}

extern void
format_time (call_traits<ptime_t>::param ptime, std::string const & format, std::ostream & os);

inline std::string
format_time (call_traits<ptime_t>::param ptime, std::string const & format)
{
    std::stringstream ss { };
    format_time (ptime, format, ss);

    return ss.str ();
}
//............................................................................
/**
 * @return 'YYYY-MM-DD'
 */
inline std::string
print_date (call_traits<date_t>::param date)
{
    return gd::to_iso_extended_string (date);
}

/**
 * @return 'YYYY-MM'
 */
extern std::string
print_month (month_index_t const mi);

//............................................................................
/**
 * attempts to parse 's' as a delimited date string ('YYYY-MM-DD'), then as an undelimited string
 *
 * @throws parse_failure
 */
extern date_t
parse_date (std::string const & s);

/**
 * @param s 'YYYY-MM'
 *
 * @throws parse_failure
 */
extern month_index_t
parse_month (std::string const & s);

/**
 * @param s 'YYYY-MM-DD HH:MM:SS[.fff]'
 *
 * @throws parse_failure
 */
extern ptime_t
parse_ptime (std::string const & s);

//............................................................................

inline date_t
current_date_local ()
{
    return gd::day_clock::local_day ();
}

inline ptime_t
current_time_local ()
{
    return pt::second_clock::local_time ();
}

} // end of 'util'
//............................................................................

template<>
inline std::string
print<util::date_t> (util::date_t const & date)
{
    return util::print_date (date);
}

} // end of namespace
//----------------------------------------------------------------------------
