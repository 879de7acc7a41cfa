#pragma once

#include "cf/budget/amount_pattern.h"
#include "cf/budget/occurrence.h"
#include "cf/cal/bank_day_oracle.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * expands an amount pattern into the concrete occurrences it produces within a
 * date window ['from', 'to']
 *
 * this is the single expansion code path used by both the timeline preview and
 * the forecast projector; it keeps no state between calls and so is idempotent
 * for a fixed bank day oracle snapshot
 *
 * candidate dates are restricted to the pattern's own ['start_date', 'end_date']
 * while the window applies to the final (bank day adjusted) date. Within one
 * pattern, adjusted dates that collide are merged into a single occurrence
 * with the summed amount unless the pattern's policy sets 'no_dedup'. Hence
 * expanding two adjacent windows partitions the dated occurrences of their union.
 */
class occurrence_generator final
{
    public: // ...............................................................

        occurrence_generator (cal::bank_day_oracle const & oracle);

        /**
         * @return occurrences sorted ascending by date
         *
         * @throws invalid_input if 'to' < 'from'
         * @throws malformed_pattern if the recurrence has out-of-range fields
         */
        occurrence_vector generate (amount_pattern const & pattern, date_t const & from, date_t const & to, int32_t const pattern_index = 0) const;

        /**
         * appending form of @ref generate()
         */
        void generate (amount_pattern const & pattern, date_t const & from, date_t const & to, int32_t const pattern_index, occurrence_vector & out) const;

    private: // ..............................................................

        cal::bank_day_oracle const & m_oracle;

}; // end of class

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
