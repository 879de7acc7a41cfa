#pragma once

#include "cf/impl/enums_impl.h"

#include <boost/preprocessor/seq/enum.hpp> // not used by enum impl but is a common need when defining them

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
/**
 * A macro invocation like this:
 *@code
 *      CF_ENUM (SOME_ENUM,
 *          (A, B, C),
 *          iterable, printable, parsable
 *      );
 *@endcode
 * generates a 'typesafe' enum of the following structure:
 *@code
 *      struct SOME_ENUM final
 *      {
 *          enum enum_t : enum_int_t
 *          {
 *              A,
 *              B,
 *              C,
 *
 *              size,
 *              na
 *          };
 *          [optional operator overloads for 'SOME_ENUM::enum_t']
 *
 *      }; // end of enum
 *@endcode
 *  where the (variadic) list of options enables the following features:
 *
 *  - 'iterable' : operator++ for classic for-loops
 *  - 'printable': operator<<, name(e)
 *  - 'parsable' : value(str)
 */
#define CF_ENUM(name, vals, /* iterable, printable, parsable */...) \
    cf_ENUM_PROLOGUE (name)                                         \
    cf_ENUM_VALUES (BOOST_PP_TUPLE_TO_SEQ (vals))                   \
    cf_ENUM_OPTIONS (BOOST_PP_TUPLE_TO_SEQ (vals), __VA_ARGS__)     \
    cf_ENUM_EPILOGUE ()                                             \
    /* */

} // end of namespace
//----------------------------------------------------------------------------
