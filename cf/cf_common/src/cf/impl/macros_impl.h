#pragma once

#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/identity.hpp>
#include <boost/preprocessor/list/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_list.hpp>
#include <boost/vmd/is_empty.hpp>

//----------------------------------------------------------------------------

#if !defined (CF_VARIADIC_TO_LIST)

#   define CF_VARIADIC_TO_LIST(...) \
        BOOST_PP_IF (BOOST_VMD_IS_EMPTY (__VA_ARGS__), BOOST_PP_EMPTY (), BOOST_PP_VARIADIC_TO_LIST (__VA_ARGS__)) \
        /* */
#endif
//............................................................................
/*
 * expand an optional list of expressions into a " {exp: value, ...}" string suffix:
 */
#define cf_emit_exp_list(is_empty, exp_list) \
    BOOST_PP_IF (is_empty, BOOST_PP_EMPTY, BOOST_PP_IDENTITY (" {"))()  \
    BOOST_PP_LIST_FOR_EACH_I (cf_emit_exp, unused, exp_list)            \
    BOOST_PP_IF (is_empty, BOOST_PP_EMPTY, BOOST_PP_IDENTITY (+ '}'))() \
    /* */

#   define cf_emit_exp(r, unused, i, exp) \
        + std::string { BOOST_PP_IF (i, BOOST_PP_IDENTITY (", "), BOOST_PP_EMPTY)() BOOST_PP_STRINGIZE (exp) ": " } + ::cf::print ((exp)) \
        /* */

#define cf_expand_exp_list(...) \
    cf_emit_exp_list (BOOST_VMD_IS_EMPTY (__VA_ARGS__), CF_VARIADIC_TO_LIST (__VA_ARGS__))

//----------------------------------------------------------------------------
