
#include "cf/budget/timeline_preview.h"

#include "cf/util/logging.h"

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{

timeline_preview::timeline_preview (cal::bank_day_oracle const & oracle) :
    m_oracle { oracle },
    m_generator { oracle }
{
}
//............................................................................

occurrence_vector
timeline_preview::preview (amount_pattern_vector const & patterns, date_t const & from, date_t const & to) const
{
    if (CF_UNLIKELY (to < from))
        throw_x (invalid_input, "invalid window [" + print (from) + ", " + print (to) + ']');

    occurrence_vector r { };

    for (int32_t p = 0, p_limit = patterns.size (); p < p_limit; ++ p)
    {
        m_generator.generate (patterns [p], from, to, p, r);
    }

    // each pattern's run is already date-sorted:

    std::stable_sort (r.begin (), r.end (), [](occurrence const & lhs, occurrence const & rhs)
        {
            return ((lhs.m_date < rhs.m_date) || ((lhs.m_date == rhs.m_date) && (lhs.m_pattern_index < rhs.m_pattern_index)));
        });

    DLOG_trace1 << "preview of " << patterns.size () << " pattern(s) [" << print (from) << ", " << print (to) << "]: " << r.size () << " occurrence(s)";

    return r;
}

std::vector<date_t>
timeline_preview::non_bank_days (date_t const & from, date_t const & to) const
{
    if (CF_UNLIKELY (to < from))
        throw_x (invalid_input, "invalid range [" + print (from) + ", " + print (to) + ']');

    int64_t const range_days = (to - from).days () + 1;
    if (CF_UNLIKELY (range_days > max_non_bank_days_range ()))
        throw_x (invalid_input, "range [" + print (from) + ", " + print (to) + "] exceeds " + string_cast (max_non_bank_days_range ()) + " days");

    return m_oracle.non_bank_days (from, to);
}

std::vector<date_t>
timeline_preview::shading_days (date_t const & from, date_t const & to) const
{
    if (CF_UNLIKELY (to < from))
        throw_x (invalid_input, "invalid range [" + print (from) + ", " + print (to) + ']');

    date_t const last = std::min (to, from + gd::days { max_non_bank_days_range () - 1 });
    if (last < to)
        LOG_trace1 << "shading clipped to [" << print (from) << ", " << print (last) << ']';

    return non_bank_days (from, last);
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
