#pragma once

#include "cf/macros.h"

//----------------------------------------------------------------------------

#if !defined (CF_BUILD_SRC_VERSION)
#   define CF_BUILD_SRC_VERSION     private
#endif

#define CF_GCC_VERSION              CF_TO_STRING (__GNUC__) "." CF_TO_STRING (__GNUC_MINOR__) "." CF_TO_STRING (__GNUC_PATCHLEVEL__)

//............................................................................

#if CF_RELEASE
#   define CF_BUILD_VARIANT         "r"
#else
#   define CF_BUILD_VARIANT         "D"
#endif

#define CF_BUILD_VERSION            CF_BUILD_VARIANT "-" CF_TO_STRING (CF_BUILD_SRC_VERSION) "-" CF_GCC_VERSION

#define CF_APP_VERSION()            char const * app_version () { return CF_BUILD_VERSION; }

#define CF_APP_MAIN()               \
CF_APP_VERSION () \
\
int \
main (int ac, char * av []) \
/* */

//----------------------------------------------------------------------------
