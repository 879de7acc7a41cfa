#pragma once

#include "cf/budget/recurrence.h"
#include "cf/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * selects the months a 'period_*' recurrence applies to
 *
 * a month is selected if the variant schedules it, it lies within the pattern's
 * [start month, end month] and its 1st day (the date its occurrence is positioned
 * on) lies within ['from', 'to']. consecutive windows therefore never select the
 * same month twice:
 *
 *  - period_once: the start month only;
 *  - period_monthly: the start month plus every 'interval'-th month after it;
 *  - period_yearly: the listed months of the start year plus every 'interval'-th
 *    year after it, excluding months before the start month;
 *
 * @return selected months in ascending order
 *
 * @throws malformed_pattern if 'r' is not a 'period_*' variant
 */
extern std::vector<month_index_t>
period_months (recurrence_pattern const & r, date_t const & start, optional<date_t> const & end, date_t const & from, date_t const & to);

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
