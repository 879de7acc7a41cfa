
#include "cf/budget/recurrence.h"

#include "cf/test/utility.h"

#include <boost/mpl/size.hpp>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................

TEST (recurrence, type_of)
{
    EXPECT_EQ (type_of (once { }), recurrence_type::once);
    EXPECT_EQ (type_of (monthly_relative { }), recurrence_type::monthly_relative);
    EXPECT_EQ (type_of (yearly_bank_day { }), recurrence_type::yearly_bank_day);
    EXPECT_EQ (type_of (period_yearly { }), recurrence_type::period_yearly);

    EXPECT_EQ (static_cast<int32_t> (recurrence_type::size), static_cast<int32_t> (boost::mpl::size<recurrence_pattern::types>::value));

    for (recurrence_type::enum_t t = recurrence_type::once; t != recurrence_type::size; ++ t)
    {
        EXPECT_EQ (recurrence_type::value (recurrence_type::name (t)), t);
    }
}

TEST (recurrence, kinds)
{
    EXPECT_TRUE (is_period (period_once { }));
    EXPECT_TRUE (is_period (period_monthly { }));
    EXPECT_FALSE (is_period (monthly_fixed { }));

    EXPECT_FALSE (is_repeating (once { }));
    EXPECT_FALSE (is_repeating (period_once { }));
    EXPECT_TRUE (is_repeating (daily { }));
    EXPECT_TRUE (is_repeating (period_yearly { }));
}

TEST (recurrence, adjustment_of)
{
    monthly_fixed mf { };
    mf.m_adjustment.m_direction = cal::bank_day_adjustment::previous;
    mf.m_adjustment.m_keep_in_month = false;

    adjustment_policy const p = adjustment_of (mf);
    EXPECT_EQ (p.m_direction, cal::bank_day_adjustment::previous);
    EXPECT_FALSE (p.m_keep_in_month);

    // variants without a policy report 'none':

    EXPECT_EQ (adjustment_of (monthly_bank_day { }).m_direction, cal::bank_day_adjustment::none);
    EXPECT_EQ (adjustment_of (period_monthly { }).m_direction, cal::bank_day_adjustment::none);
}

TEST (recurrence, validate)
{
    validate (once { });
    validate (monthly_fixed { 31, 1, { } });
    validate (period_yearly { { 1, 6, 12 }, 2 });

    EXPECT_THROW (validate (daily { 0, { } }), malformed_pattern);
    EXPECT_THROW (validate (monthly_fixed { 0, 1, { } }), malformed_pattern);
    EXPECT_THROW (validate (monthly_fixed { 32, 1, { } }), malformed_pattern);
    EXPECT_THROW (validate (monthly_bank_day { 11, false, 1 }), malformed_pattern);
    EXPECT_THROW (validate (yearly_bank_day { 13, 1, false, 1 }), malformed_pattern);
    EXPECT_THROW (validate (period_yearly { { }, 1 }), malformed_pattern);
    EXPECT_THROW (validate (period_yearly { { 0 }, 1 }), malformed_pattern);

    yearly y { };
    y.m_anchor = fixed_day { 40 };
    EXPECT_THROW (validate (y), malformed_pattern);

    // 'malformed_pattern' is an 'illegal_state':

    EXPECT_THROW (validate (period_monthly { -1 }), illegal_state);
}

TEST (recurrence, weekday_encoding)
{
    EXPECT_EQ (weekday_from_index (0).as_number (), gd::Monday);
    EXPECT_EQ (weekday_from_index (4).as_number (), gd::Friday);
    EXPECT_EQ (weekday_from_index (6).as_number (), gd::Sunday);

    for (int32_t i = 0; i < 7; ++ i)
    {
        EXPECT_EQ (weekday_index (weekday_from_index (i)), i);
    }

    EXPECT_THROW (weekday_from_index (7), invalid_input);
    EXPECT_THROW (weekday_from_index (-1), invalid_input);
}

TEST (recurrence, equality)
{
    recurrence_pattern const r1 { monthly_fixed { 15, 1, { } } };
    recurrence_pattern const r2 { monthly_fixed { 15, 1, { } } };
    recurrence_pattern const r3 { monthly_fixed { 16, 1, { } } };
    recurrence_pattern const r4 { daily { } };

    EXPECT_TRUE (r1 == r2);
    EXPECT_FALSE (r1 == r3);
    EXPECT_FALSE (r1 == r4);

    EXPECT_EQ (string_cast (r1), "{monthly_fixed, day: 15, interval: 1}");
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
