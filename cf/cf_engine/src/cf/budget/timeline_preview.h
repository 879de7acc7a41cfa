#pragma once

#include "cf/budget/occurrence_generator.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * windowed occurrence queries for (possibly unsaved) draft patterns, expanded through
 * the same @ref occurrence_generator the forecast uses
 */
class timeline_preview final
{
    public: // ...............................................................

        timeline_preview (cal::bank_day_oracle const & oracle);

        /**
         * @return occurrences of all 'patterns' in ['from', 'to'] sorted by (date, pattern index)
         *
         * @throws invalid_input if 'to' < 'from'
         */
        occurrence_vector preview (amount_pattern_vector const & patterns, date_t const & from, date_t const & to) const;

        /**
         * @return non-bank days in ['from', 'to'], for shading a timeline
         *
         * @throws invalid_input if 'to' < 'from' or the range exceeds @ref max_non_bank_days_range() days
         */
        std::vector<date_t> non_bank_days (date_t const & from, date_t const & to) const;

        /**
         * @return non-bank days for shading a preview window of any length: the window
         *         is clipped to its first @ref max_non_bank_days_range() days
         *
         * @throws invalid_input if 'to' < 'from'
         */
        std::vector<date_t> shading_days (date_t const & from, date_t const & to) const;

        static constexpr int32_t max_non_bank_days_range ()     { return 366; }

    private: // ..............................................................

        cal::bank_day_oracle const & m_oracle;
        occurrence_generator const m_generator;

}; // end of class

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
