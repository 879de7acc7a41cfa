
#include "cf/cal/holidays.h"

#include "cf/str_hash.h"
#include "cf/util/logging.h"

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................
//............................................................................
namespace
{
/*
 * Danish bank holidays: fixed dates plus Easter-relative ones
 * (Maundy Thursday, Good Friday, Easter Sunday/Monday, Ascension, Whit Sunday/Monday)
 */
struct DK_holidays final: public holiday_rules
{
    std::string const & country () const override
    {
        static std::string const g_country { "DK" };

        return g_country;
    }

    std::vector<date_t> holidays (int32_t const year) const override
    {
        std::vector<date_t> r { };

        uint16_t const y = static_cast<uint16_t> (year);

        r.emplace_back (y, gd::Jan, 1);     // New Year's Day
        r.emplace_back (y, gd::Jun, 5);     // Constitution Day
        r.emplace_back (y, gd::Dec, 25);    // Christmas Day
        r.emplace_back (y, gd::Dec, 26);    // Boxing Day

        date_t const easter = easter_sunday (year);

        for (int32_t const offset : { -3, -2, 0, 1, 39, 49, 50 })
        {
            r.push_back (easter + gd::date_duration { offset });
        }

        std::sort (r.begin (), r.end ());

        return r;
    }

}; // end of class

} // end of anonymous
//............................................................................
//............................................................................

date_t
easter_sunday (int32_t const year)
{
    int32_t const a = year % 19;
    int32_t const b = year / 100;
    int32_t const c = year % 100;
    int32_t const d = b / 4;
    int32_t const e = b % 4;
    int32_t const f = (b + 8) / 25;
    int32_t const g = (b - f + 1) / 3;
    int32_t const h = (19 * a + b - d - g + 15) % 30;
    int32_t const i = c / 4;
    int32_t const k = c % 4;
    int32_t const l = (32 + 2 * e + 2 * i - h - k) % 7;
    int32_t const m = (a + 11 * h + 22 * l) / 451;

    int32_t const month = (h + l - 7 * m + 114) / 31;
    int32_t const day = ((h + l - 7 * m + 114) % 31) + 1;

    return { static_cast<uint16_t> (year), static_cast<uint16_t> (month), static_cast<uint16_t> (day) };
}
//............................................................................

std::unique_ptr<holiday_rules>
make_holiday_rules (std::string const & country)
{
    switch (str_hash_32 (country))
    {
        case "DK"_hash: return std::make_unique<DK_holidays> ();

        default: break;

    } // end of switch

    throw_x (invalid_input, "no holiday rules for country " + print (country));
}

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
