#pragma once

#include "cf/config.h" // define _GNU_SOURCE
#include "cf/impl/macros_impl.h"

#include <boost/config.hpp>

//----------------------------------------------------------------------------

#if !defined (__GNUC__)
#   error expected a gcc-compatible compiler
#endif

// helper preprocessing macros:

#if !defined (CF_TO_STRING)
#   define CF_TO_STRING(x)          BOOST_PP_STRINGIZE (x)
#endif

#define CF_FILENAME                 ::cf::util::impl::path_stem (__FILE__)

// default input validation:

#if defined (NDEBUG)
#   define CF_DEBUG                 0
#   define CF_RELEASE               1
#else
#   define CF_DEBUG                 1
#   define CF_RELEASE               0
#endif

#if defined (NDEBUG)
#   define CF_IF_DEBUG(...)
#   define CF_IF_RELEASE(...)       __VA_ARGS__
#else
#   define CF_IF_DEBUG(...)         __VA_ARGS__
#   define CF_IF_RELEASE(...)
#endif

//............................................................................

//  var/function qualifiers:

#define CF_FORCEINLINE              BOOST_FORCEINLINE
#define CF_NOINLINE                 BOOST_NOINLINE
#define CF_NOEXCEPT                 BOOST_NOEXCEPT_OR_NOTHROW
#define CF_NORETURN                 BOOST_NORETURN

#define CF_ASSUME_HOT               __attribute__ ((hot))
#define CF_ASSUME_COLD              __attribute__ ((cold))

#define CF_UNUSED                   __attribute__ ((unused))

//  branches:

#define CF_LIKELY(condition)        __builtin_expect(static_cast<bool> (condition), 1)
#define CF_UNLIKELY(condition)      __builtin_expect(static_cast<bool> (condition), 0)

/*
 * unlike the release-only '__builtin_unreachable()' variant, this always throws:
 * switch statements over closed enum sets rely on it
 */
#define CF_ASSUME_UNREACHABLE(...)  throw_x (::cf::illegal_state, "reached code assumed unreachable" cf_expand_exp_list (__VA_ARGS__))

//----------------------------------------------------------------------------
