
#include "cf/cal/calendar.h"

#include "cf/cal/holidays.h"
#include "cf/settings.h"
#include "cf/util/logging.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................

using date_set          = std::set<date_t>;
using iterator          = calendar::iterator;

struct calendar::pimpl final
{
    pimpl (holiday_rules const & rules, date_t const & first, date_t const & last, std::vector<date_t> const & extra_closures) :
        m_first { first },
        m_last { last }
    {
        check_condition (! (first.is_special () || last.is_special ()));
        check_le (first, last);

        for (util::day_iterator i { first }; * i <= last; ++ i)
        {
            gd::greg_weekday const wd = i->day_of_week ();
            if ((wd == gd::Saturday) || (wd == gd::Sunday))
                m_set.insert (* i);
        }

        for (int32_t y = first.year (), y_limit = last.year (); y <= y_limit; ++ y)
        {
            for (date_t const & h : rules.holidays (y))
            {
                if ((first <= h) && (h <= last)) m_set.insert (h);
            }
        }

        for (date_t const & d : extra_closures)
        {
            if ((first <= d) && (d <= last)) m_set.insert (d);
        }

        LOG_trace1 << "[" << rules.country () << "] materialized " << m_set.size () << " non-bank day(s) in [" << print (first) << ", " << print (last) << ']';
    }


    void check_in_range (date_t const & d) const
    {
        if (CF_UNLIKELY ((d < m_first) || (m_last < d)))
            throw_x (out_of_bounds, "date " + print (d) + " outside of calendar range [" + print (m_first) + ", " + print (m_last) + ']');
    }

    iterator find (rop::enum_t const op, date_t const & d) const
    {
        switch (op)
        {
            case rop::EQ: return m_set.find (d);
            case rop::GE: return m_set.lower_bound (d);
            case rop::GT: return m_set.upper_bound (d);

            case rop::LE:
            case rop::LT:
            {
                iterator i = (op == rop::LE ? m_set.upper_bound (d) : m_set.lower_bound (d));
                return (i == m_set.begin () ? m_set.end () : -- i);
            }

            default: break;

        } // end of switch

        throw_x (invalid_input, "unsupported op " + print (op));
    }


    date_t const m_first;
    date_t const m_last;
    date_set m_set { };

}; // end of nested class
//............................................................................
//............................................................................
namespace
{

std::vector<date_t>
parse_extra_closures (settings const & cfg)
{
    std::vector<date_t> r { };

    auto const i = cfg.find ("extra_holidays");
    if (i != cfg.end ())
    {
        check_condition (i->is_array (), print (i->type ()));

        for (settings const & d : * i)
        {
            r.push_back (util::parse_date (d.get<std::string> ()));
        }
    }

    return r;
}

} // end of anonymous
//............................................................................
//............................................................................

calendar::calendar (holiday_rules const & rules, date_t const & first, date_t const & last, std::vector<date_t> const & extra_closures) :
    m_impl { std::make_unique<pimpl> (rules, first, last, extra_closures) }
{
}

calendar::calendar (settings const & cfg, date_t const & first, date_t const & last) :
    m_impl { std::make_unique<pimpl> (* make_holiday_rules (get_or<std::string> (cfg, "country", "DK")), first, last, parse_extra_closures (cfg)) }
{
}

calendar::~calendar ()    = default; // pimpl

calendar::calendar (calendar && rhs)                = default;
calendar & calendar::operator= (calendar && rhs)    = default;
//............................................................................

date_t const &
calendar::first () const
{
    assert_nonnull (m_impl);
    return m_impl->m_first;
}

date_t const &
calendar::last () const
{
    assert_nonnull (m_impl);
    return m_impl->m_last;
}
//............................................................................

iterator
calendar::begin () const
{
    assert_nonnull (m_impl);
    return m_impl->m_set.begin ();
}

iterator
calendar::end () const
{
    assert_nonnull (m_impl);
    return m_impl->m_set.end ();
}
//............................................................................

bool
calendar::contains (date_t const & d) const
{
    assert_nonnull (m_impl);
    m_impl->check_in_range (d);

    return m_impl->m_set.count (d);
}

iterator
calendar::find (rop::enum_t const op, date_t const & d) const
{
    assert_nonnull (m_impl);
    return m_impl->find (op, d);
}
//............................................................................

bool
calendar::is_bank_day (date_t const & d) const
{
    return (! contains (d));
}

std::vector<date_t>
calendar::non_bank_days (date_t const & from, date_t const & to) const
{
    assert_nonnull (m_impl);
    check_le (from, to);

    m_impl->check_in_range (from);
    m_impl->check_in_range (to);

    std::vector<date_t> r { };

    for (iterator i = find (rop::GE, from), i_end = end (); (i != i_end) && (* i <= to); ++ i)
    {
        r.push_back (* i);
    }

    return r;
}

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
