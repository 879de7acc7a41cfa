
#include "cf/util/datetime.h"

#include "cf/util/logging.h"
#include "cf/util/parse.h"

#include <boost/io/ios_state.hpp>
#include <boost/lexical_cast.hpp>

#include <locale>

//----------------------------------------------------------------------------
namespace cf
{
namespace util
{
//............................................................................

void
format_date (call_traits<date_t>::param date, std::string const & format, std::ostream & os)
{
    std::locale const out_loc { std::locale::classic (), new gd::date_facet { format.c_str () } };  // note: locale obj takes facet ownership

    boost::io::basic_ios_locale_saver<std::ostream::char_type, std::ostream::traits_type> _ { os };
    {
        os.imbue (out_loc);
    }

    os << date;
}

void
format_time (call_traits<ptime_t>::param ptime, std::string const & format, std::ostream & os)
{
    std::locale const out_loc { std::locale::classic (), new pt::time_facet { format.c_str () } };  // note: locale obj takes facet ownership

    boost::io::basic_ios_locale_saver<std::ostream::char_type, std::ostream::traits_type> _ { os };
    {
        os.imbue (out_loc);
    }

    os << ptime;
}
//............................................................................

std::string
print_month (month_index_t const mi)
{
    return format_date (month_start (mi), "%Y-%m");
}
//............................................................................

date_t
parse_date (std::string const & s)
{
    try
    {
        return gd::from_string (s);
    }
    catch (std::exception const & e)
    {
        DLOG_trace2 << "not a delimited date " << print (s) << ": " << e.what ();
    }

    try
    {
        return gd::from_undelimited_string (s);
    }
    catch (std::exception const & e)
    {
        chain_x (parse_failure, "failed to parse " + print (s) + " as date");
    }

    CF_ASSUME_UNREACHABLE (s);
}

month_index_t
parse_month (std::string const & s)
{
    string_vector const tokens = util::split (s, "-");
    if (tokens.size () != 2)
        throw_x (parse_failure, "failed to parse " + print (s) + " as month");

    try
    {
        int32_t const year = boost::lexical_cast<int32_t> (tokens [0]);
        int32_t const month = boost::lexical_cast<int32_t> (tokens [1]);

        check_in_inclusive_range (month, 1, 12);

        return month_index (date_t { static_cast<uint16_t> (year), static_cast<uint16_t> (month), 1 }); // validates 'year'
    }
    catch (std::exception const & e)
    {
        chain_x (parse_failure, "failed to parse " + print (s) + " as month");
    }

    CF_ASSUME_UNREACHABLE (s);
}

ptime_t
parse_ptime (std::string const & s)
{
    ptime_t r { };
    try
    {
        r = pt::time_from_string (s);
    }
    catch (std::exception const & e)
    {
        chain_x (parse_failure, "failed to parse " + print (s) + " as date/time");
    }

    if (r.is_special ())
        throw_x (parse_failure, "failed to parse " + print (s) + " as date/time");

    return r;
}

} // end of 'util'
} // end of namespace
//----------------------------------------------------------------------------
