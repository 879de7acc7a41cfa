#pragma once

#include "cf/cal/bank_day_oracle.h"
#include "cf/operators.h"
#include "cf/settings_fwd.h"

#include <memory>
#include <set>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
class holiday_rules; // forward

/**
 * a materialized snapshot of non-bank days (weekends, holidays and any extra closures)
 * over a fixed date range ['first', 'last']
 *
 * queries outside of that range throw 'out_of_bounds': the snapshot is expected to be
 * built with enough margin for whatever window the engine is asked about
 */
class calendar final: public bank_day_oracle // move-copyable, move-assignable
{
    private: // ..............................................................

        using date_set          = std::set<date_t>;

    public: // ...............................................................

        using iterator          = date_set::const_iterator;

        /**
         * @param extra_closures additional non-bank days (need not be inside ['first', 'last'])
         */
        calendar (holiday_rules const & rules, date_t const & first, date_t const & last, std::vector<date_t> const & extra_closures = { });

        /**
         * @param cfg [optional fields: "country" (default "DK"), "extra_holidays" (list of dates)]
         */
        calendar (settings const & cfg, date_t const & first, date_t const & last);

        ~calendar ();

        calendar (calendar && rhs);
        calendar & operator= (calendar && rhs);

        // ACCESSORs:

        date_t const & first () const;
        date_t const & last () const;

        // iteration (over non-bank days):

        iterator begin () const;
        iterator end () const;

        // query:

        /**
         * @return 'true' iff 'd' is a non-bank day
         */
        bool contains (date_t const & d) const;

        /**
         * @return first non-bank day 'x' (last for 'LT'/'LE') such that 'x op d' holds, or 'end()'
         */
        iterator find (rop::enum_t const op, date_t const & d) const;

        // bank_day_oracle:

        bool is_bank_day (date_t const & d) const override;
        std::vector<date_t> non_bank_days (date_t const & from, date_t const & to) const override;

    private: // ..............................................................

        class pimpl; // forward

        std::unique_ptr<pimpl> m_impl;

}; // end of class

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
