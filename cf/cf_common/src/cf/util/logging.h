#pragma once

#include "cf/macros.h"

#define GLOG_NO_ABBREVIATED_SEVERITIES
#include <glog/logging.h>

//----------------------------------------------------------------------------

// logging that is never elided (with verbosity controlled at runtime):

#define LOG_trace1                  VLOG(1)
#define LOG_trace2                  VLOG(2)

#define LOG_info                    LOG(INFO)
#define LOG_warn                    LOG(WARNING)
#define LOG_error                   LOG(ERROR)

// logging that is elided in release builds:

#define DLOG_trace1                 DVLOG(1)
#define DLOG_trace2                 DVLOG(2)

//............................................................................
//............................................................................

namespace cf
{
namespace util
{
/*
 * this function guarantees that logging will be initialized once and MT-safely.
 */
extern CF_ASSUME_COLD bool log_initialize ();

} // end of 'util'
} // end of namespace
//............................................................................
//............................................................................
namespace
{
/*
 * trigger logging initialization from any compilation unit that includes this header
 * (the actual setup logic will be executed once only).
 */
bool const cf_log_initialize_done CF_UNUSED { cf::util::log_initialize () };

} // end of anonymous
//----------------------------------------------------------------------------
