
#include "cf/budget/occurrence_generator.h"

#include "cf/test/calendars.h"
#include "cf/test/utility.h"

#include <numeric>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
namespace
{

amount_pattern
make_pattern (amount_t const amount, date_t const & start, recurrence_pattern const & r, optional<date_t> const & end = { })
{
    amount_pattern p { };

    p.m_amount = amount;
    p.m_start_date = start;
    p.m_end_date = end;
    p.m_recurrence = r;
    p.m_container_ids = { "checking" };

    return p;
}

adjustment_policy
make_policy (cal::bank_day_adjustment::enum_t const direction, bool const keep_in_month = true, bool const no_dedup = false)
{
    adjustment_policy r { };

    r.m_direction = direction;
    r.m_keep_in_month = keep_in_month;
    r.m_no_dedup = no_dedup;

    return r;
}

std::vector<date_t>
dates_of (occurrence_vector const & os)
{
    std::vector<date_t> r { };
    for (occurrence const & o : os)
        r.push_back (o.m_date);

    return r;
}

amount_t
total_of (occurrence_vector const & os)
{
    return std::accumulate (os.begin (), os.end (), amount_t { }, [](amount_t const s, occurrence const & o) { return (s + o.m_amount); });
}

} // end of anonymous
//............................................................................

TEST (occurrence_generator, monthly_fixed_day_31)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (120000, { 2024, 1, 1 }, monthly_fixed { 31, 1, { } });

    occurrence_vector const os = g.generate (p, { 2024, 1, 1 }, { 2024, 4, 30 });

    std::vector<date_t> const expected { { 2024, 1, 31 }, { 2024, 2, 29 }, { 2024, 3, 31 }, { 2024, 4, 30 } };
    EXPECT_EQ (dates_of (os), expected);

    for (occurrence const & o : os)
    {
        EXPECT_EQ (o.m_amount, 120000);
        EXPECT_EQ (o.m_pattern_index, 0);
        EXPECT_EQ (o.m_kind, occurrence_kind::dated);
    }
}

TEST (occurrence_generator, monthly_fixed_clamped_non_leap)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (100, { 2023, 1, 1 }, monthly_fixed { 31, 1, { } });

    std::vector<date_t> const expected { { 2023, 1, 31 }, { 2023, 2, 28 }, { 2023, 3, 31 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2023, 1, 1 }, { 2023, 3, 31 })), expected);
}

TEST (occurrence_generator, monthly_fixed_interval_and_start)
{
    occurrence_generator const g { test::dk_calendar () };

    // start after the day of the first month: the first candidate is in the next month

    amount_pattern const p = make_pattern (100, { 2024, 1, 15 }, monthly_fixed { 10, 3, { } });

    std::vector<date_t> const expected { { 2024, 4, 10 }, { 2024, 7, 10 }, { 2024, 10, 10 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2024, 12, 31 })), expected);

    // a window far past the start is reached without walking from it:

    std::vector<date_t> const expected_far { { 2030, 1, 10 }, { 2030, 4, 10 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2030, 1, 1 }, { 2030, 6, 30 })), expected_far);
}

TEST (occurrence_generator, end_date_clips)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, monthly_fixed { 15, 1, { } }, date_t { 2024, 3, 10 });

    std::vector<date_t> const expected { { 2024, 1, 15 }, { 2024, 2, 15 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2024, 12, 31 })), expected);

    EXPECT_TRUE (g.generate (p, { 2024, 4, 1 }, { 2024, 12, 31 }).empty ());
}

TEST (occurrence_generator, monthly_relative_last_friday)
{
    occurrence_generator const g { test::dk_calendar () };

    monthly_relative r { };
    r.m_weekday = gd::Friday;
    r.m_position = relative_position::last;

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, r);

    // May 2024 and Jan 2025 start on a Wednesday and end on the target Friday

    std::vector<date_t> const expected_2024
    {
        { 2024, 1, 26 }, { 2024, 2, 23 }, { 2024, 3, 29 }, { 2024, 4, 26 }, { 2024, 5, 31 }, { 2024, 6, 28 }
    };
    EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2024, 6, 30 })), expected_2024);

    std::vector<date_t> const expected_2025 { { 2025, 1, 31 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2025, 1, 1 }, { 2025, 1, 31 })), expected_2025);
}

TEST (occurrence_generator, monthly_relative_nth)
{
    occurrence_generator const g { test::dk_calendar () };

    monthly_relative r { };
    r.m_weekday = gd::Thursday;
    r.m_position = relative_position::fourth;

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, r);

    std::vector<date_t> const expected { { 2024, 11, 28 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2024, 11, 1 }, { 2024, 11, 30 })), expected);

    r.m_weekday = gd::Monday;
    r.m_position = relative_position::first;

    std::vector<date_t> const expected_first { { 2024, 1, 1 }, { 2024, 2, 5 } };
    EXPECT_EQ (dates_of (g.generate (make_pattern (100, { 2024, 1, 1 }, r), { 2024, 1, 1 }, { 2024, 2, 29 })), expected_first);
}

TEST (occurrence_generator, daily_and_weekly)
{
    occurrence_generator const g { test::dk_calendar () };

    {
        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, daily { 3, { } });

        std::vector<date_t> const expected { { 2024, 1, 7 }, { 2024, 1, 10 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 5 }, { 2024, 1, 12 })), expected);
    }
    {
        weekly w { };
        w.m_weekday = gd::Wednesday;
        w.m_interval = 2;

        // start on a Monday: first candidate is Wed 2024-01-03, then every other week

        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, w);

        std::vector<date_t> const expected { { 2024, 2, 14 }, { 2024, 2, 28 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 2, 1 }, { 2024, 2, 29 })), expected);
    }
}

TEST (occurrence_generator, once_adjusted_previous)
{
    occurrence_generator const g { test::dk_calendar () };

    // 2024-06-29 is a Saturday:

    amount_pattern const p = make_pattern (-50000, { 2024, 6, 29 }, once { make_policy (cal::bank_day_adjustment::previous) });

    occurrence_vector const os = g.generate (p, { 2024, 6, 1 }, { 2024, 6, 30 });

    ASSERT_EQ (os.size (), 1U);
    EXPECT_EQ (os [0].m_date, date_t (2024, 6, 28));
    EXPECT_EQ (os [0].m_amount, -50000);

    // the adjusted date, not the candidate, decides window membership:

    EXPECT_TRUE (g.generate (p, { 2024, 6, 29 }, { 2024, 6, 30 }).empty ());
    EXPECT_EQ (g.generate (p, { 2024, 6, 28 }, { 2024, 6, 28 }).size (), 1U);
}

TEST (occurrence_generator, once_adjusted_across_window)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (700, { 2024, 6, 29 }, once { make_policy (cal::bank_day_adjustment::next, false) });

    EXPECT_TRUE (g.generate (p, { 2024, 6, 1 }, { 2024, 6, 30 }).empty ());

    occurrence_vector const os = g.generate (p, { 2024, 7, 1 }, { 2024, 7, 31 });

    ASSERT_EQ (os.size (), 1U);
    EXPECT_EQ (os [0].m_date, date_t (2024, 7, 1));
}

TEST (occurrence_generator, keep_in_month)
{
    occurrence_generator const g { test::dk_calendar () };

    // Sun 2024-06-30 and Sat 2024-08-31: "next" would leave the month

    amount_pattern const p = make_pattern (100, { 2024, 6, 1 }, monthly_fixed { 31, 2, make_policy (cal::bank_day_adjustment::next) });

    std::vector<date_t> const expected { { 2024, 6, 28 }, { 2024, 8, 30 } };
    EXPECT_EQ (dates_of (g.generate (p, { 2024, 6, 1 }, { 2024, 9, 30 })), expected);

    amount_pattern const q = make_pattern (100, { 2024, 6, 1 }, monthly_fixed { 31, 2, make_policy (cal::bank_day_adjustment::next, false) });

    std::vector<date_t> const expected_spill { { 2024, 7, 1 }, { 2024, 9, 2 } };
    EXPECT_EQ (dates_of (g.generate (q, { 2024, 6, 1 }, { 2024, 9, 30 })), expected_spill);
}

TEST (occurrence_generator, dedup)
{
    occurrence_generator const g { test::dk_calendar () };

    date_t const from { 2024, 6, 28 };
    date_t const to { 2024, 7, 2 };

    // Sat 06-29, Sun 06-30 and Mon 07-01 all land on 07-01:
    {
        amount_pattern const p = make_pattern (100, { 2024, 6, 1 }, daily { 1, make_policy (cal::bank_day_adjustment::next, false) });

        occurrence_vector const os = g.generate (p, from, to);

        std::vector<date_t> const expected { { 2024, 6, 28 }, { 2024, 7, 1 }, { 2024, 7, 2 } };
        ASSERT_EQ (dates_of (os), expected);

        EXPECT_EQ (os [0].m_amount, 100);
        EXPECT_EQ (os [1].m_amount, 300);
        EXPECT_EQ (os [2].m_amount, 100);
    }
    // ... unless 'no_dedup' is set:
    {
        amount_pattern const p = make_pattern (100, { 2024, 6, 1 }, daily { 1, make_policy (cal::bank_day_adjustment::next, false, true) });

        occurrence_vector const os = g.generate (p, from, to);

        std::vector<date_t> const expected { { 2024, 6, 28 }, { 2024, 7, 1 }, { 2024, 7, 1 }, { 2024, 7, 1 }, { 2024, 7, 2 } };
        EXPECT_EQ (dates_of (os), expected);
        EXPECT_EQ (total_of (os), 500);
    }
    // with 'keep_in_month' the weekend stays in June:
    {
        amount_pattern const p = make_pattern (100, { 2024, 6, 1 }, daily { 1, make_policy (cal::bank_day_adjustment::next) });

        occurrence_vector const os = g.generate (p, from, to);

        std::vector<date_t> const expected { { 2024, 6, 28 }, { 2024, 7, 1 }, { 2024, 7, 2 } };
        ASSERT_EQ (dates_of (os), expected);

        EXPECT_EQ (os [0].m_amount, 300);
        EXPECT_EQ (os [1].m_amount, 100);
    }
}

TEST (occurrence_generator, adjacent_windows_partition)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, daily { 1, make_policy (cal::bank_day_adjustment::next, false) });

    amount_t const whole = total_of (g.generate (p, { 2024, 3, 1 }, { 2024, 4, 30 }));
    amount_t const parts = total_of (g.generate (p, { 2024, 3, 1 }, { 2024, 3, 31 })) + total_of (g.generate (p, { 2024, 4, 1 }, { 2024, 4, 30 }));

    EXPECT_EQ (parts, whole);
}

TEST (occurrence_generator, monthly_bank_day)
{
    occurrence_generator const g { test::dk_calendar () };

    {
        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, monthly_bank_day { 1, false, 1 });

        std::vector<date_t> const expected { { 2024, 1, 2 }, { 2024, 2, 1 }, { 2024, 3, 1 }, { 2024, 4, 2 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2024, 4, 30 })), expected);
    }
    {
        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, monthly_bank_day { 1, true, 1 });

        std::vector<date_t> const expected { { 2024, 1, 31 }, { 2024, 2, 29 }, { 2024, 3, 27 }, { 2024, 4, 30 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2024, 4, 30 })), expected);
    }
}

TEST (occurrence_generator, yearly)
{
    occurrence_generator const g { test::dk_calendar () };

    {
        yearly y { };
        y.m_month = 12;
        y.m_anchor = fixed_day { 24 };
        y.m_interval = 2;

        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, y);

        std::vector<date_t> const expected { { 2024, 12, 24 }, { 2026, 12, 24 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2027, 12, 31 })), expected);
    }
    {
        yearly y { };
        y.m_month = 3;
        y.m_anchor = relative_day { relative_position::last, gd::Sunday };

        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, y);

        std::vector<date_t> const expected { { 2024, 3, 31 }, { 2025, 3, 30 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2025, 12, 31 })), expected);
    }
    {
        // start after this year's anchor month:

        yearly y { };
        y.m_month = 3;
        y.m_anchor = fixed_day { 1 };

        amount_pattern const p = make_pattern (100, { 2024, 6, 15 }, y);

        std::vector<date_t> const expected { { 2025, 3, 1 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2025, 12, 31 })), expected);
    }
    {
        amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, yearly_bank_day { 12, 1, true, 1 });

        std::vector<date_t> const expected { { 2024, 12, 31 }, { 2025, 12, 31 } };
        EXPECT_EQ (dates_of (g.generate (p, { 2024, 1, 1 }, { 2025, 12, 31 })), expected);
    }
}

TEST (occurrence_generator, period_monthly)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (5000, { 2024, 3, 1 }, period_monthly { 1 });

    occurrence_vector const os = g.generate (p, { 2024, 1, 1 }, { 2024, 12, 31 });
    ASSERT_EQ (os.size (), 10U);

    for (int32_t i = 0; i < 10; ++ i)
    {
        EXPECT_EQ (os [i].m_date, date_t (2024, 3 + i, 1));
        EXPECT_EQ (os [i].m_kind, occurrence_kind::period);
        EXPECT_EQ (os [i].m_amount, 5000);
    }
}

TEST (occurrence_generator, period_monthly_mid_month_windows)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (400, { 2024, 2, 1 }, period_monthly { 1 });

    EXPECT_TRUE (g.generate (p, { 2024, 3, 27 }, { 2024, 3, 27 }).empty ());

    occurrence_vector const a = g.generate (p, { 2024, 3, 15 }, { 2024, 3, 20 });
    occurrence_vector const b = g.generate (p, { 2024, 3, 21 }, { 2024, 4, 30 });

    EXPECT_TRUE (a.empty ());
    ASSERT_EQ (b.size (), 1U);
    EXPECT_EQ (b [0].m_date, date_t (2024, 4, 1));

    // every occurrence stays inside its window:

    occurrence_vector const c = g.generate (p, { 2024, 1, 10 }, { 2024, 6, 20 });
    ASSERT_EQ (c.size (), 5U);
    EXPECT_EQ (c.front ().m_date, date_t (2024, 2, 1));
    EXPECT_EQ (c.back ().m_date, date_t (2024, 6, 1));
}

TEST (occurrence_generator, determinism)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, monthly_fixed { 31, 1, make_policy (cal::bank_day_adjustment::previous) });

    occurrence_vector const os1 = g.generate (p, { 2024, 1, 1 }, { 2025, 12, 31 }, 3);
    occurrence_vector const os2 = g.generate (p, { 2024, 1, 1 }, { 2025, 12, 31 }, 3);

    EXPECT_EQ (os1.size (), 24U);
    EXPECT_EQ (os1, os2);
    EXPECT_EQ (os1.front ().m_pattern_index, 3);
}

TEST (occurrence_generator, errors)
{
    occurrence_generator const g { test::dk_calendar () };

    amount_pattern const p = make_pattern (100, { 2024, 1, 1 }, monthly_fixed { 31, 1, { } });

    EXPECT_THROW (g.generate (p, { 2024, 2, 1 }, { 2024, 1, 1 }), invalid_input);

    amount_pattern const bad = make_pattern (100, { 2024, 1, 1 }, monthly_fixed { 0, 1, { } });
    EXPECT_THROW (g.generate (bad, { 2024, 1, 1 }, { 2024, 12, 31 }), malformed_pattern);

    // an empty effective range is not an error:

    EXPECT_TRUE (g.generate (p, { 2023, 1, 1 }, { 2023, 12, 31 }).empty ());
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
