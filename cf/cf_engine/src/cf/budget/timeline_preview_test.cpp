
#include "cf/budget/timeline_preview.h"

#include "cf/budget/forecast_projector.h"

#include "cf/test/calendars.h"
#include "cf/test/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
namespace
{

amount_pattern
make_pattern (amount_t const amount, date_t const & start, recurrence_pattern const & r)
{
    amount_pattern p { };

    p.m_amount = amount;
    p.m_start_date = start;
    p.m_recurrence = r;
    p.m_container_ids = { "checking" };

    return p;
}

adjustment_policy
make_policy (cal::bank_day_adjustment::enum_t const direction)
{
    adjustment_policy r { };
    r.m_direction = direction;

    return r;
}

amount_pattern_vector
make_patterns ()
{
    monthly_relative last_friday { };
    last_friday.m_weekday = gd::Friday;
    last_friday.m_position = relative_position::last;

    weekly mondays { };
    mondays.m_weekday = gd::Monday;

    return
    {
        make_pattern (100, { 2024, 1, 1 }, mondays),
        make_pattern (200, { 2024, 1, 1 }, monthly_fixed { 31, 1, make_policy (cal::bank_day_adjustment::previous) }),
        make_pattern (300, { 2024, 1, 1 }, last_friday),
        make_pattern (400, { 2024, 2, 1 }, period_monthly { 1 }),
        make_pattern (500, { 2024, 3, 30 }, once { make_policy (cal::bank_day_adjustment::next) })
    };
}

} // end of anonymous
//............................................................................

TEST (timeline_preview, ordering)
{
    timeline_preview const tp { test::dk_calendar () };

    occurrence_vector const os = tp.preview (make_patterns (), { 2024, 1, 1 }, { 2024, 3, 31 });
    ASSERT_FALSE (os.empty ());

    for (std::size_t i = 1; i < os.size (); ++ i)
    {
        occurrence const & a = os [i - 1];
        occurrence const & b = os [i];

        EXPECT_TRUE ((a.m_date < b.m_date) || ((a.m_date == b.m_date) && (a.m_pattern_index <= b.m_pattern_index))) << a << ' ' << b;
    }

    bool found_same_day { false };
    for (std::size_t i = 1; i < os.size (); ++ i)
    {
        if (os [i - 1].m_date == os [i].m_date)
        {
            found_same_day = true;
            EXPECT_LT (os [i - 1].m_pattern_index, os [i].m_pattern_index);
        }
    }

    // Fri 2024-03-29 is Good Friday: the "31st, previous" payment lands on Wed 03-27,
    // the "once on Sat 03-30, next" one is kept in March on the same Wednesday

    EXPECT_TRUE (found_same_day);
}

TEST (timeline_preview, easter_collision)
{
    timeline_preview const tp { test::dk_calendar () };

    occurrence_vector const os = tp.preview (make_patterns (), { 2024, 3, 27 }, { 2024, 3, 27 });

    ASSERT_EQ (os.size (), 2U);

    EXPECT_EQ (os [0].m_pattern_index, 1);
    EXPECT_EQ (os [0].m_amount, 200);
    EXPECT_EQ (os [1].m_pattern_index, 4);
    EXPECT_EQ (os [1].m_amount, 500);
}

TEST (timeline_preview, agrees_with_forecast)
{
    amount_pattern_vector const patterns = make_patterns ();

    timeline_preview const tp { test::dk_calendar () };
    forecast_projector const fp { test::dk_calendar (), 0 };

    budget_post post { };
    post.m_id = "p";
    post.m_category_path = { "p" };
    post.m_direction = direction::expense;
    post.m_container_ids = { "checking" };
    post.m_patterns = patterns;

    month_index_t const first = util::month_index (2024, 1);
    int32_t const months = 12;

    forecast_result const fr = fp.project ({ post }, { }, first, months);
    ASSERT_EQ (fr.m_projections.size (), static_cast<std::size_t> (months));

    for (int32_t m = 0; m < months; ++ m)
    {
        occurrence_vector const os = tp.preview (patterns, util::month_start (first + m), util::month_end (first + m));

        amount_t sum { };
        for (occurrence const & o : os)
            sum += o.m_amount;

        EXPECT_EQ (sum, fr.m_projections [m].m_expected_expenses) << util::print_month (first + m);
    }
}

TEST (timeline_preview, non_bank_days)
{
    timeline_preview const tp { test::dk_calendar () };

    std::vector<date_t> const nbd = tp.non_bank_days ({ 2024, 12, 21 }, { 2024, 12, 27 });

    std::vector<date_t> const expected { { 2024, 12, 21 }, { 2024, 12, 22 }, { 2024, 12, 25 }, { 2024, 12, 26 } };
    EXPECT_EQ (nbd, expected);

    // 366 days is the maximum range:

    EXPECT_NO_THROW (tp.non_bank_days ({ 2024, 1, 1 }, { 2024, 12, 31 }));
    EXPECT_THROW (tp.non_bank_days ({ 2024, 1, 1 }, { 2025, 1, 1 }), invalid_input);
    EXPECT_THROW (tp.non_bank_days ({ 2024, 1, 2 }, { 2024, 1, 1 }), invalid_input);
}

TEST (timeline_preview, long_window_shading)
{
    timeline_preview const tp { test::dk_calendar () };

    // a two-year preview is not limited by the shading range:

    date_t const from { 2024, 1, 1 };
    date_t const to { 2025, 12, 31 };

    occurrence_vector const os = tp.preview (make_patterns (), from, to);
    ASSERT_FALSE (os.empty ());
    EXPECT_GT (os.back ().m_date, date_t (2025, 1, 1));

    std::vector<date_t> const shading = tp.shading_days (from, to);
    ASSERT_FALSE (shading.empty ());
    EXPECT_EQ (shading, tp.non_bank_days (from, { 2024, 12, 31 }));

    // short windows are not clipped:

    std::vector<date_t> const expected { { 2024, 12, 21 }, { 2024, 12, 22 }, { 2024, 12, 25 }, { 2024, 12, 26 } };
    EXPECT_EQ (tp.shading_days ({ 2024, 12, 21 }, { 2024, 12, 27 }), expected);

    EXPECT_THROW (tp.shading_days ({ 2024, 1, 2 }, { 2024, 1, 1 }), invalid_input);
}

TEST (timeline_preview, invalid_window)
{
    timeline_preview const tp { test::dk_calendar () };

    EXPECT_THROW (tp.preview (make_patterns (), { 2024, 2, 1 }, { 2024, 1, 31 }), invalid_input);
    EXPECT_TRUE (tp.preview ({ }, { 2024, 1, 1 }, { 2024, 1, 31 }).empty ());
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
