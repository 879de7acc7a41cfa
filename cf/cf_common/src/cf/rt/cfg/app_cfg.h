#pragma once

#include "cf/filesystem.h"
#include "cf/settings_fwd.h"
#include "cf/util/datetime.h"

#include <memory>

//----------------------------------------------------------------------------
namespace cf
{
namespace rt
{
/**
 * read-only application configuration, loaded once per session
 *
 * the session start time is "now" unless overridden via "/app_cfg/time"
 * (which makes anything derived from "today" reproducible)
 */
class app_cfg final: noncopyable
{
    public: // ...............................................................

        app_cfg (fs::path const & source);
        app_cfg (settings const & cfg);
        app_cfg (settings && cfg);

        ~app_cfg ();


        // ACCESSORs:

        /**
         * equivalent to 'scope("")'
         */
        settings const & root () const;

        /**
         * @param path [JSON pointer]
         */
        bool scope_exists (scope_path const & path) const;

        /**
         * @param path [JSON pointer]
         */
        settings const & scope (scope_path const & path) const;

        /**
         * @invariant 'start_time ().date () == start_date ()'
         */
        util::ptime_t const & start_time () const;

        util::date_t start_date () const;

    private: // ..............................................................

        class pimpl; // forward

        std::unique_ptr<pimpl> const m_impl;

}; // end of class

} // end of 'rt'
} // end of namespace
//----------------------------------------------------------------------------
