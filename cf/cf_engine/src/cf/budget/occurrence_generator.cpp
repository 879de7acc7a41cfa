
#include "cf/budget/occurrence_generator.h"

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

/*
 * smallest 'k' >= 0 such that 'k * interval >= distance'
 */
inline int64_t
first_step (int64_t const distance, int32_t const interval)
{
    return (distance <= 0 ? 0 : (distance + interval - 1) / interval);
}

date_t
clamped_date (month_index_t const mi, int32_t const day_of_month)
{
    int32_t const year = util::month_year (mi);
    int32_t const month = util::month_of (mi);

    return { static_cast<uint16_t> (year), static_cast<uint16_t> (month), static_cast<uint16_t> (std::min (day_of_month, util::days_in_month (year, month))) };
}

/*
 * "last" scans backward from the end of the month, the others forward from its start
 */
date_t
relative_date (month_index_t const mi, relative_position::enum_t const pos, weekday_t const wd)
{
    if (pos == relative_position::last)
    {
        date_t d = util::month_end (mi);
        while (d.day_of_week ().as_number () != wd.as_number ())
            d -= gd::days { 1 };

        return d;
    }

    date_t d = util::month_start (mi);
    while (d.day_of_week ().as_number () != wd.as_number ())
        d += gd::days { 1 };

    return (d + gd::weeks { pos }); // 'first' is 0
}
//............................................................................
/*
 * emits raw (unadjusted) candidate dates in ['m_lo', 'm_hi'], in ascending order;
 * the first candidate is computed arithmetically from the pattern start
 */
struct candidate_visitor final: public boost::static_visitor<>
{
    candidate_visitor (date_t const & start, date_t const & lo, date_t const & hi, cal::bank_day_oracle const & oracle, std::vector<date_t> & out) :
        m_start { start },
        m_lo { lo },
        m_hi { hi },
        m_oracle { oracle },
        m_out { out }
    {
    }


    void operator() (once const &) const
    {
        emit (m_start);
    }

    void operator() (daily const & v) const
    {
        step_days (m_start, v.m_interval);
    }

    void operator() (weekly const & v) const
    {
        int32_t const shift = (v.m_weekday.as_number () - m_start.day_of_week ().as_number () + 7) % 7;

        step_days (m_start + gd::days { shift }, 7 * v.m_interval);
    }

    void operator() (monthly_fixed const & v) const
    {
        for (month_index_t m = first_month (util::month_index (m_start), v.m_interval), m_limit = util::month_index (m_hi); m <= m_limit; m += v.m_interval)
        {
            emit (clamped_date (m, v.m_day_of_month));
        }
    }

    void operator() (monthly_relative const & v) const
    {
        for (month_index_t m = first_month (util::month_index (m_start), v.m_interval), m_limit = util::month_index (m_hi); m <= m_limit; m += v.m_interval)
        {
            emit (relative_date (m, v.m_position, v.m_weekday));
        }
    }

    void operator() (monthly_bank_day const & v) const
    {
        for (month_index_t m = first_month (util::month_index (m_start), v.m_interval), m_limit = util::month_index (m_hi); m <= m_limit; m += v.m_interval)
        {
            emit_bank_day (m, v.m_bank_day_number, v.m_from_end);
        }
    }

    void operator() (yearly const & v) const
    {
        for (int32_t y = first_year (v.m_interval), y_limit = m_hi.year (); y <= y_limit; y += v.m_interval)
        {
            month_index_t const m = util::month_index (y, v.m_month);

            if (fixed_day const * const fd = boost::get<fixed_day> (& v.m_anchor))
                emit (clamped_date (m, fd->m_day_of_month));
            else
            {
                relative_day const & rd = boost::get<relative_day> (v.m_anchor);
                emit (relative_date (m, rd.m_position, rd.m_weekday));
            }
        }
    }

    void operator() (yearly_bank_day const & v) const
    {
        for (int32_t y = first_year (v.m_interval), y_limit = m_hi.year (); y <= y_limit; y += v.m_interval)
        {
            emit_bank_day (util::month_index (y, v.m_month), v.m_bank_day_number, v.m_from_end);
        }
    }

    template<typename T> // 'period_*'
    void operator() (T const & v) const
    {
        throw_x (malformed_pattern, "not a dated recurrence: " + string_cast (v));
    }

    private: // ..............................................................

        void emit (date_t const & d) const
        {
            if ((d >= m_lo) && (d <= m_hi))
                m_out.push_back (d);
        }

        void emit_bank_day (month_index_t const m, int32_t const n, bool const from_end) const
        {
            optional<date_t> const d = cal::nth_bank_day (util::month_year (m), util::month_of (m), n, from_end, m_oracle);
            if (d) emit (* d);
        }

        void step_days (date_t const & first, int32_t const step) const
        {
            for (date_t d = first + gd::days { first_step ((m_lo - first).days (), step) * step }; d <= m_hi; d += gd::days { step })
            {
                emit (d);
            }
        }

        month_index_t first_month (month_index_t const anchor, int32_t const interval) const
        {
            return (anchor + first_step (util::month_index (m_lo) - anchor, interval) * interval);
        }

        int32_t first_year (int32_t const interval) const
        {
            int32_t const anchor = m_start.year ();
            return (anchor + first_step (m_lo.year () - anchor, interval) * interval);
        }


        date_t const m_start;
        date_t const m_lo;
        date_t const m_hi;
        cal::bank_day_oracle const & m_oracle;
        std::vector<date_t> & m_out;

}; // end of class
//............................................................................

void
merge_same_day (occurrence_vector & out, occurrence_vector::iterator const begin)
{
    auto w = begin;
    for (auto i = begin; i != out.end (); ++ i)
    {
        if ((w != begin) && ((w - 1)->m_date == i->m_date))
            (w - 1)->m_amount += i->m_amount;
        else
            * w ++ = * i;
    }

    out.erase (w, out.end ());
}

} // end of anonymous
//............................................................................
//............................................................................

occurrence_generator::occurrence_generator (cal::bank_day_oracle const & oracle) :
    m_oracle { oracle }
{
}
//............................................................................

occurrence_vector
occurrence_generator::generate (amount_pattern const & pattern, date_t const & from, date_t const & to, int32_t const pattern_index) const
{
    occurrence_vector r { };
    generate (pattern, from, to, pattern_index, r);

    return r;
}

void
occurrence_generator::generate (amount_pattern const & pattern, date_t const & from, date_t const & to, int32_t const pattern_index, occurrence_vector & out) const
{
    if (CF_UNLIKELY (to < from))
        throw_x (invalid_input, "invalid window [" + print (from) + ", " + print (to) + ']');

    if (CF_UNLIKELY (pattern.m_start_date.is_special ()))
        throw_x (malformed_pattern, "pattern start date not set: " + string_cast (pattern));

    recurrence_pattern const & r = pattern.m_recurrence;
    validate (r);

    if (is_period (r))
    {
        for (month_index_t const m : period_months (r, pattern.m_start_date, pattern.m_end_date, from, to))
        {
            out.push_back ({ pattern_index, util::month_start (m), pattern.m_amount, occurrence_kind::period });
        }
        return;
    }

    adjustment_policy const policy = adjustment_of (r);
    bool const adjusted = (policy.m_direction != cal::bank_day_adjustment::none);
    gd::days const margin { adjusted ? adjustment_margin_days () : 0 };

    date_t const c_lo = std::max (pattern.m_start_date, from - margin);
    date_t const c_hi = (pattern.m_end_date ? std::min (* pattern.m_end_date, to + margin) : to + margin);

    if (c_lo > c_hi)
        return;

    std::vector<date_t> candidates { };
    boost::apply_visitor (candidate_visitor { pattern.m_start_date, c_lo, c_hi, m_oracle, candidates }, r);

    std::size_t const out_size = out.size ();

    for (date_t const & c : candidates)
    {
        date_t const d = (adjusted ? cal::adjust_to_bank_day (c, policy, m_oracle) : c);

        if ((d >= from) && (d <= to))
            out.push_back ({ pattern_index, d, pattern.m_amount, occurrence_kind::dated });
    }

    auto const begin = out.begin () + out_size;

    // a 'keep_in_month' reversal can reorder adjusted dates:

    std::stable_sort (begin, out.end (), [](occurrence const & lhs, occurrence const & rhs) { return (lhs.m_date < rhs.m_date); });

    if (! policy.m_no_dedup)
        merge_same_day (out, begin);

    DLOG_trace2 << "pattern #" << pattern_index << ' ' << pattern << " [" << print (from) << ", " << print (to) << "]: "
                << candidates.size () << " candidate(s), " << (out.size () - out_size) << " occurrence(s)";
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
