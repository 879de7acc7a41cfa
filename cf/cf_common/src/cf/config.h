#pragma once

#if !defined (_GNU_SOURCE)
#   define _GNU_SOURCE
#endif

//----------------------------------------------------------------------------

// common prefix for environment variables and derived names (log filenames, etc):

#if !defined (CF_APP_NAME)
#	define CF_APP_NAME              "CF"
#endif

// environment variables:

#if !defined (CF_ENV_LOG_ROOT)
#	define CF_ENV_LOG_ROOT          CF_APP_NAME "_LOG_ROOT"
#endif

#if !defined (CF_ENV_LOG_CONSOLE)
#   define CF_ENV_LOG_CONSOLE       CF_APP_NAME "_LOG_CONSOLE"
#endif

#if !defined (CF_ENV_SIG_HANDLER)
#	define CF_ENV_SIG_HANDLER       CF_APP_NAME "_SIG_HANDLER"
#endif

//----------------------------------------------------------------------------
