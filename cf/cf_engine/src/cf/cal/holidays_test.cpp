
#include "cf/cal/holidays.h"

#include "cf/test/utility.h"

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................

TEST (easter_sunday, known_years)
{
    EXPECT_EQ (easter_sunday (2023), date_t (2023, 4, 9));
    EXPECT_EQ (easter_sunday (2024), date_t (2024, 3, 31));
    EXPECT_EQ (easter_sunday (2025), date_t (2025, 4, 20));
    EXPECT_EQ (easter_sunday (2026), date_t (2026, 4, 5));
    EXPECT_EQ (easter_sunday (2000), date_t (2000, 4, 23));
}

TEST (holiday_rules, DK_2024)
{
    std::unique_ptr<holiday_rules> const rules = make_holiday_rules ("DK");
    ASSERT_TRUE (rules);
    EXPECT_EQ (rules->country (), "DK");

    std::vector<date_t> const hs = rules->holidays (2024);

    std::vector<date_t> const expected
    {
        { 2024, 1, 1 },     // New Year's Day
        { 2024, 3, 28 },    // Maundy Thursday
        { 2024, 3, 29 },    // Good Friday
        { 2024, 3, 31 },    // Easter Sunday
        { 2024, 4, 1 },     // Easter Monday
        { 2024, 5, 9 },     // Ascension Day
        { 2024, 5, 19 },    // Whit Sunday
        { 2024, 5, 20 },    // Whit Monday
        { 2024, 6, 5 },     // Constitution Day
        { 2024, 12, 25 },
        { 2024, 12, 26 }
    };

    EXPECT_EQ (hs, expected);
    EXPECT_TRUE (std::is_sorted (hs.begin (), hs.end ()));
}

TEST (holiday_rules, unknown_country)
{
    EXPECT_THROW (make_holiday_rules ("XX"), invalid_input);
    EXPECT_THROW (make_holiday_rules (""), invalid_input);
}

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
