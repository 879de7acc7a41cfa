
#include "cf/cal/bank_day_adjuster.h"

#include "cf/test/calendars.h"
#include "cf/test/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................
namespace
{

adjustment_policy
make_policy (bank_day_adjustment::enum_t const direction, bool const keep_in_month = true)
{
    adjustment_policy r { };
    r.m_direction = direction;
    r.m_keep_in_month = keep_in_month;

    return r;
}

/*
 * an oracle with no bank days at all
 */
struct closed_oracle final: public bank_day_oracle
{
    bool is_bank_day (date_t const & d) const override
    {
        return false;
    }

    std::vector<date_t> non_bank_days (date_t const & from, date_t const & to) const override
    {
        std::vector<date_t> r { };
        for (date_t d = from; d <= to; d += gd::date_duration { 1 })
            r.push_back (d);

        return r;
    }

}; // end of class

} // end of anonymous
//............................................................................

TEST (bank_day_adjuster, bank_day_is_kept)
{
    calendar const & c = test::dk_calendar ();

    date_t const fri { 2024, 6, 28 };

    for (bank_day_adjustment::enum_t a = bank_day_adjustment::none; a != bank_day_adjustment::size; ++ a)
    {
        EXPECT_EQ (adjust_to_bank_day (fri, make_policy (a), c), fri) << a;
    }
}

TEST (bank_day_adjuster, none)
{
    calendar const & c = test::dk_calendar ();

    date_t const sat { 2024, 6, 29 };
    EXPECT_EQ (adjust_to_bank_day (sat, make_policy (bank_day_adjustment::none), c), sat);
}

TEST (bank_day_adjuster, previous)
{
    calendar const & c = test::dk_calendar ();

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 6, 29 }, make_policy (bank_day_adjustment::previous), c), date_t (2024, 6, 28));
    EXPECT_EQ (adjust_to_bank_day ({ 2024, 6, 30 }, make_policy (bank_day_adjustment::previous), c), date_t (2024, 6, 28));

    // Easter Monday back across the whole Easter block:

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 4, 1 }, make_policy (bank_day_adjustment::previous, false), c), date_t (2024, 3, 27));

    // 2024-09-01 is a Sunday: walking back leaves September, so reverse to Monday

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 9, 1 }, make_policy (bank_day_adjustment::previous), c), date_t (2024, 9, 2));
    EXPECT_EQ (adjust_to_bank_day ({ 2024, 9, 1 }, make_policy (bank_day_adjustment::previous, false), c), date_t (2024, 8, 30));
}

TEST (bank_day_adjuster, next)
{
    calendar const & c = test::dk_calendar ();

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 6, 22 }, make_policy (bank_day_adjustment::next), c), date_t (2024, 6, 24));

    // end of month:

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 6, 29 }, make_policy (bank_day_adjustment::next), c), date_t (2024, 6, 28));
    EXPECT_EQ (adjust_to_bank_day ({ 2024, 6, 29 }, make_policy (bank_day_adjustment::next, false), c), date_t (2024, 7, 1));

    // 2024-03-30 (Saturday of the Easter block): next bank day is in April, previous one is 03-27

    EXPECT_EQ (adjust_to_bank_day ({ 2024, 3, 30 }, make_policy (bank_day_adjustment::next), c), date_t (2024, 3, 27));
    EXPECT_EQ (adjust_to_bank_day ({ 2024, 3, 30 }, make_policy (bank_day_adjustment::next, false), c), date_t (2024, 4, 2));
}

TEST (bank_day_adjuster, walk_limit)
{
    closed_oracle const c { };

    auto const f = [&]() { return adjust_to_bank_day ({ 2024, 6, 29 }, make_policy (bank_day_adjustment::next), c); };
    EXPECT_THROW (f (), illegal_state);
}

TEST (bank_day_adjuster, nth_bank_day)
{
    calendar const & c = test::dk_calendar ();

    EXPECT_EQ (nth_bank_day (2024, 1, 1, false, c), date_t (2024, 1, 2));  // Jan 1 is a holiday
    EXPECT_EQ (nth_bank_day (2024, 1, 1, true, c), date_t (2024, 1, 31));
    EXPECT_EQ (nth_bank_day (2024, 1, 2, true, c), date_t (2024, 1, 30));
    EXPECT_EQ (nth_bank_day (2024, 3, 1, true, c), date_t (2024, 3, 27)); // Easter block

    EXPECT_EQ (nth_bank_day (2024, 1, 22, false, c), date_t (2024, 1, 31));
    EXPECT_FALSE (nth_bank_day (2024, 1, 23, false, c));

    auto const f = [&]() { return nth_bank_day (2024, 1, 0, false, c); };
    EXPECT_THROW (f (), invalid_input);
}

TEST (adjustment_policy, equality)
{
    adjustment_policy const p1 { };
    adjustment_policy p2 { };

    EXPECT_EQ (p1, p2);
    EXPECT_EQ (p1.m_direction, bank_day_adjustment::none);
    EXPECT_TRUE (p1.m_keep_in_month);
    EXPECT_FALSE (p1.m_no_dedup);

    p2.m_no_dedup = true;
    EXPECT_FALSE (p1 == p2);
}

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
