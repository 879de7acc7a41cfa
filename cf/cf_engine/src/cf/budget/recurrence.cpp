
#include "cf/budget/recurrence.h"

#include "cf/strings.h"

#include <ostream>
#include <tuple>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
//............................................................................
namespace
{

struct adjustment_visitor final: public boost::static_visitor<adjustment_policy>
{
    template<typename T>
    auto operator() (T const & r) const -> decltype (r.m_adjustment)
    {
        return r.m_adjustment;
    }

    adjustment_policy operator() (monthly_bank_day const &) const       { return { }; }
    adjustment_policy operator() (yearly_bank_day const &) const        { return { }; }
    adjustment_policy operator() (period_once const &) const            { return { }; }
    adjustment_policy operator() (period_monthly const &) const         { return { }; }
    adjustment_policy operator() (period_yearly const &) const          { return { }; }

}; // end of class
//............................................................................

void
check_interval (int32_t const interval, recurrence_pattern const & r)
{
    if (CF_UNLIKELY (interval < 1))
        throw_x (malformed_pattern, "invalid interval " + string_cast (interval) + " in " + string_cast (r));
}

void
check_day_of_month (int32_t const day_of_month, recurrence_pattern const & r)
{
    if (CF_UNLIKELY ((day_of_month < 1) || (day_of_month > 31)))
        throw_x (malformed_pattern, "invalid day of month " + string_cast (day_of_month) + " in " + string_cast (r));
}

void
check_month (int32_t const month, recurrence_pattern const & r)
{
    if (CF_UNLIKELY ((month < 1) || (month > 12)))
        throw_x (malformed_pattern, "invalid month " + string_cast (month) + " in " + string_cast (r));
}

void
check_bank_day_number (int32_t const n, recurrence_pattern const & r)
{
    if (CF_UNLIKELY ((n < 1) || (n > max_bank_day_number ())))
        throw_x (malformed_pattern, "invalid bank day number " + string_cast (n) + " in " + string_cast (r));
}

void
check_position (relative_position::enum_t const pos, recurrence_pattern const & r)
{
    if (CF_UNLIKELY ((pos < relative_position::first) || (pos >= relative_position::size)))
        throw_x (malformed_pattern, "invalid relative position in " + string_cast (r));
}

void
check_adjustment (adjustment_policy const & policy, recurrence_pattern const & r)
{
    if (CF_UNLIKELY ((policy.m_direction < cal::bank_day_adjustment::none) || (policy.m_direction >= cal::bank_day_adjustment::size)))
        throw_x (malformed_pattern, "invalid bank day adjustment in " + string_cast (r));
}
//............................................................................

struct validate_visitor final: public boost::static_visitor<>
{
    validate_visitor (recurrence_pattern const & r) :
        m_r { r }
    {
    }

    void operator() (once const & v) const
    {
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (daily const & v) const
    {
        check_interval (v.m_interval, m_r);
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (weekly const & v) const
    {
        check_interval (v.m_interval, m_r);
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (monthly_fixed const & v) const
    {
        check_day_of_month (v.m_day_of_month, m_r);
        check_interval (v.m_interval, m_r);
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (monthly_relative const & v) const
    {
        check_position (v.m_position, m_r);
        check_interval (v.m_interval, m_r);
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (monthly_bank_day const & v) const
    {
        check_bank_day_number (v.m_bank_day_number, m_r);
        check_interval (v.m_interval, m_r);
    }

    void operator() (yearly const & v) const
    {
        check_month (v.m_month, m_r);

        switch (v.m_anchor.which ())
        {
            case 0: check_day_of_month (boost::get<fixed_day> (v.m_anchor).m_day_of_month, m_r); break;
            default: check_position (boost::get<relative_day> (v.m_anchor).m_position, m_r); break;

        } // end of switch

        check_interval (v.m_interval, m_r);
        check_adjustment (v.m_adjustment, m_r);
    }

    void operator() (yearly_bank_day const & v) const
    {
        check_month (v.m_month, m_r);
        check_bank_day_number (v.m_bank_day_number, m_r);
        check_interval (v.m_interval, m_r);
    }

    void operator() (period_once const &) const
    {
    }

    void operator() (period_monthly const & v) const
    {
        check_interval (v.m_interval, m_r);
    }

    void operator() (period_yearly const & v) const
    {
        if (CF_UNLIKELY (v.m_months.empty ()))
            throw_x (malformed_pattern, "empty month list in " + string_cast (m_r));

        for (int32_t const m : v.m_months)
            check_month (m, m_r);

        check_interval (v.m_interval, m_r);
    }


    recurrence_pattern const & m_r;

}; // end of class
//............................................................................

std::ostream &
print_policy (std::ostream & os, adjustment_policy const & policy)
{
    if (policy.m_direction != cal::bank_day_adjustment::none)
        os << ", adjustment: " << policy;

    return os;
}

} // end of anonymous
//............................................................................
//............................................................................

adjustment_policy
adjustment_of (recurrence_pattern const & r)
{
    return boost::apply_visitor (adjustment_visitor { }, r);
}

void
validate (recurrence_pattern const & r)
{
    boost::apply_visitor (validate_visitor { r }, r);
}
//............................................................................

weekday_t
weekday_from_index (int32_t const index)
{
    if (CF_UNLIKELY ((index < 0) || (index > 6)))
        throw_x (out_of_bounds, "invalid weekday index " + string_cast (index) + " (0 = Monday, ..., 6 = Sunday)");

    return { static_cast<weekday_t::value_type> ((index + 1) % 7) };
}

int32_t
weekday_index (weekday_t const wd)
{
    return ((wd.as_number () + 6) % 7);
}
//............................................................................

bool
operator== (once const & lhs, once const & rhs)
{
    return (lhs.m_adjustment == rhs.m_adjustment);
}

std::ostream &
operator<< (std::ostream & os, once const & obj)
{
    os << "{once";
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (daily const & lhs, daily const & rhs)
{
    return ((lhs.m_interval == rhs.m_interval) && (lhs.m_adjustment == rhs.m_adjustment));
}

std::ostream &
operator<< (std::ostream & os, daily const & obj)
{
    os << "{daily, interval: " << obj.m_interval;
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (weekly const & lhs, weekly const & rhs)
{
    return ((lhs.m_weekday == rhs.m_weekday) && (lhs.m_interval == rhs.m_interval) && (lhs.m_adjustment == rhs.m_adjustment));
}

std::ostream &
operator<< (std::ostream & os, weekly const & obj)
{
    os << "{weekly, " << obj.m_weekday.as_short_string () << ", interval: " << obj.m_interval;
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (monthly_fixed const & lhs, monthly_fixed const & rhs)
{
    return ((lhs.m_day_of_month == rhs.m_day_of_month) && (lhs.m_interval == rhs.m_interval) && (lhs.m_adjustment == rhs.m_adjustment));
}

std::ostream &
operator<< (std::ostream & os, monthly_fixed const & obj)
{
    os << "{monthly_fixed, day: " << obj.m_day_of_month << ", interval: " << obj.m_interval;
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (monthly_relative const & lhs, monthly_relative const & rhs)
{
    return ((lhs.m_weekday == rhs.m_weekday) && (lhs.m_position == rhs.m_position) && (lhs.m_interval == rhs.m_interval) && (lhs.m_adjustment == rhs.m_adjustment));
}

std::ostream &
operator<< (std::ostream & os, monthly_relative const & obj)
{
    os << "{monthly_relative, " << obj.m_position << ' ' << obj.m_weekday.as_short_string () << ", interval: " << obj.m_interval;
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (monthly_bank_day const & lhs, monthly_bank_day const & rhs)
{
    return (std::tie (lhs.m_bank_day_number, lhs.m_from_end, lhs.m_interval) == std::tie (rhs.m_bank_day_number, rhs.m_from_end, rhs.m_interval));
}

std::ostream &
operator<< (std::ostream & os, monthly_bank_day const & obj)
{
    return os << "{monthly_bank_day, " << obj.m_bank_day_number << (obj.m_from_end ? " from end" : "") << ", interval: " << obj.m_interval << '}';
}

bool
operator== (fixed_day const & lhs, fixed_day const & rhs)
{
    return (lhs.m_day_of_month == rhs.m_day_of_month);
}

std::ostream &
operator<< (std::ostream & os, fixed_day const & obj)
{
    return os << "day " << obj.m_day_of_month;
}

bool
operator== (relative_day const & lhs, relative_day const & rhs)
{
    return ((lhs.m_position == rhs.m_position) && (lhs.m_weekday == rhs.m_weekday));
}

std::ostream &
operator<< (std::ostream & os, relative_day const & obj)
{
    return os << obj.m_position << ' ' << obj.m_weekday.as_short_string ();
}

bool
operator== (yearly const & lhs, yearly const & rhs)
{
    return ((lhs.m_month == rhs.m_month) && (lhs.m_anchor == rhs.m_anchor) && (lhs.m_interval == rhs.m_interval) && (lhs.m_adjustment == rhs.m_adjustment));
}

std::ostream &
operator<< (std::ostream & os, yearly const & obj)
{
    os << "{yearly, month: " << obj.m_month << ", " << obj.m_anchor << ", interval: " << obj.m_interval;
    return print_policy (os, obj.m_adjustment) << '}';
}

bool
operator== (yearly_bank_day const & lhs, yearly_bank_day const & rhs)
{
    return (std::tie (lhs.m_month, lhs.m_bank_day_number, lhs.m_from_end, lhs.m_interval) == std::tie (rhs.m_month, rhs.m_bank_day_number, rhs.m_from_end, rhs.m_interval));
}

std::ostream &
operator<< (std::ostream & os, yearly_bank_day const & obj)
{
    return os << "{yearly_bank_day, month: " << obj.m_month << ", " << obj.m_bank_day_number << (obj.m_from_end ? " from end" : "") << ", interval: " << obj.m_interval << '}';
}

bool
operator== (period_once const &, period_once const &)
{
    return true;
}

std::ostream &
operator<< (std::ostream & os, period_once const &)
{
    return os << "{period_once}";
}

bool
operator== (period_monthly const & lhs, period_monthly const & rhs)
{
    return (lhs.m_interval == rhs.m_interval);
}

std::ostream &
operator<< (std::ostream & os, period_monthly const & obj)
{
    return os << "{period_monthly, interval: " << obj.m_interval << '}';
}

bool
operator== (period_yearly const & lhs, period_yearly const & rhs)
{
    return ((lhs.m_months == rhs.m_months) && (lhs.m_interval == rhs.m_interval));
}

std::ostream &
operator<< (std::ostream & os, period_yearly const & obj)
{
    return os << "{period_yearly, months: " << print (obj.m_months) << ", interval: " << obj.m_interval << '}';
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
