#pragma once

#include "cf/util/datetime.h"

#include <vector>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
using util::date_t;

/**
 * read-only bank day predicate
 *
 * implementations are expected to be immutable snapshots (see @ref calendar),
 * safe to share across threads without coordination
 */
class bank_day_oracle
{
    public: // ...............................................................

        virtual ~bank_day_oracle ()   = default;

        /**
         * @return 'true' iff 'd' is a weekday that is not a bank holiday
         */
        virtual bool is_bank_day (date_t const & d) const = 0;

        /**
         * @return all dates in ['from', 'to'] that are not bank days, in ascending order
         */
        virtual std::vector<date_t> non_bank_days (date_t const & from, date_t const & to) const = 0;

}; // end of class

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
