
#include "cf/cal/bank_day_adjuster.h"

#include "cf/util/logging.h"

#include <ostream>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
//............................................................................
//............................................................................
namespace
{

date_t
walk_to_bank_day (date_t const & d, int32_t const step, bank_day_oracle const & oracle)
{
    date_t r { d };

    for (int32_t i = 0; i < max_adjustment_walk (); ++ i)
    {
        r += gd::date_duration { step };

        if (oracle.is_bank_day (r))
            return r;
    }

    throw_x (illegal_state, "no bank day within " + string_cast (max_adjustment_walk ()) + " days of " + print (d) + " (step " + string_cast (step) + ')');
}

} // end of anonymous
//............................................................................
//............................................................................

std::ostream &
operator<< (std::ostream & os, adjustment_policy const & obj)
{
    return os << '{' << obj.m_direction << ", keep_in_month: " << obj.m_keep_in_month << ", no_dedup: " << obj.m_no_dedup << '}';
}
//............................................................................

date_t
adjust_to_bank_day (date_t const & d, adjustment_policy const & policy, bank_day_oracle const & oracle)
{
    if ((policy.m_direction == bank_day_adjustment::none) || oracle.is_bank_day (d))
        return d;

    int32_t step { };
    switch (policy.m_direction)
    {
        case bank_day_adjustment::next:     step = 1; break;
        case bank_day_adjustment::previous: step = -1; break;

        default: CF_ASSUME_UNREACHABLE (policy);

    } // end of switch

    date_t r = walk_to_bank_day (d, step, oracle);

    if (policy.m_keep_in_month && (util::month_index (r) != util::month_index (d)))
    {
        date_t const r_reversed = walk_to_bank_day (d, - step, oracle);
        DLOG_trace2 << print (d) << ": " << print (r) << " leaves the month, reversed to " << print (r_reversed);

        r = r_reversed;
    }

    return r;
}
//............................................................................

optional<date_t>
nth_bank_day (int32_t const year, int32_t const month, int32_t const n, bool const from_end, bank_day_oracle const & oracle)
{
    check_positive (n);

    util::month_index_t const mi = util::month_index (year, month);

    date_t const first = util::month_start (mi);
    date_t const last = util::month_end (mi);

    int32_t count { };

    if (from_end)
    {
        for (date_t d = last; d >= first; d -= gd::date_duration { 1 })
        {
            if (oracle.is_bank_day (d) && (++ count == n))
                return d;
        }
    }
    else
    {
        for (date_t d = first; d <= last; d += gd::date_duration { 1 })
        {
            if (oracle.is_bank_day (d) && (++ count == n))
                return d;
        }
    }

    DLOG_trace2 << util::print_month (mi) << " has fewer than " << n << " bank day(s)";
    return { };
}

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
