
#include "cf/budget/period_aggregator.h"

#include "cf/util/logging.h"

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
//............................................................................
namespace
{

inline int32_t
first_step (int32_t const distance, int32_t const interval)
{
    return (distance <= 0 ? 0 : (distance + interval - 1) / interval);
}
//............................................................................

struct period_visitor final: public boost::static_visitor<>
{
    period_visitor (month_index_t const start_month, month_index_t const lo, month_index_t const hi, std::vector<month_index_t> & out) :
        m_start_month { start_month },
        m_lo { lo },
        m_hi { hi },
        m_out { out }
    {
    }

    void operator() (period_once const &) const
    {
        if ((m_start_month >= m_lo) && (m_start_month <= m_hi))
            m_out.push_back (m_start_month);
    }

    void operator() (period_monthly const & v) const
    {
        for (month_index_t m = m_start_month + first_step (m_lo - m_start_month, v.m_interval) * v.m_interval; m <= m_hi; m += v.m_interval)
        {
            m_out.push_back (m);
        }
    }

    void operator() (period_yearly const & v) const
    {
        std::vector<int32_t> const months = sorted_unique (v.m_months);

        int32_t const start_year = util::month_year (m_start_month);
        int32_t const lo_year = util::month_year (m_lo);
        int32_t const hi_year = util::month_year (m_hi);

        for (int32_t y = start_year + first_step (lo_year - start_year, v.m_interval) * v.m_interval; y <= hi_year; y += v.m_interval)
        {
            for (int32_t const month : months)
            {
                month_index_t const m = util::month_index (y, month);

                if ((m >= m_start_month) && (m >= m_lo) && (m <= m_hi))
                    m_out.push_back (m);
            }
        }
    }

    template<typename T>
    void operator() (T const & v) const
    {
        throw_x (malformed_pattern, "not a period recurrence: " + string_cast (v));
    }


    month_index_t const m_start_month;
    month_index_t const m_lo;
    month_index_t const m_hi;
    std::vector<month_index_t> & m_out;

}; // end of class

} // end of anonymous
//............................................................................
//............................................................................

std::vector<month_index_t>
period_months (recurrence_pattern const & r, date_t const & start, optional<date_t> const & end, date_t const & from, date_t const & to)
{
    std::vector<month_index_t> r_months { };

    // a period is positioned on the 1st of its month, so only months whose
    // 1st falls inside ['from', 'to'] are eligible:

    month_index_t const window_lo = util::month_index (from) + (from.day () == 1 ? 0 : 1);
    month_index_t const window_hi = util::month_index (to);

    month_index_t const lo = std::max (util::month_index (start), window_lo);
    month_index_t const hi = (end ? std::min (util::month_index (* end), window_hi) : window_hi);

    if (lo > hi)
        return r_months;

    boost::apply_visitor (period_visitor { util::month_index (start), lo, hi, r_months }, r);

    DLOG_trace2 << r << " [" << util::print_month (lo) << ", " << util::print_month (hi) << "]: " << r_months.size () << " period(s)";

    return r_months;
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
