#pragma once

#include "cf/cal/calendar.h"
#include "cf/filesystem.h"
#include "cf/rt/cfg/app_cfg.h"
#include "cf/util/json_fwd.h"

#include <memory>

//----------------------------------------------------------------------------
namespace cf
{
/**
 * @param file [empty means "all defaults"]
 */
extern std::unique_ptr<rt::app_cfg>
load_cfg (fs::path const & file);

/**
 * materializes a calendar snapshot (per the optional "/calendar" scope of 'cfg')
 * covering ['from', 'to'] with enough slack on both sides for bank day adjustments
 */
extern cal::calendar
make_calendar (rt::app_cfg const & cfg, util::date_t const & from, util::date_t const & to);

/**
 * writes 'j' to 'out' or, if that's empty, to stdout
 */
extern void
emit (json const & j, fs::path const & out);

} // end of namespace
//----------------------------------------------------------------------------
