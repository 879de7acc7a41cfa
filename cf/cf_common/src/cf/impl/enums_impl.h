#pragma once

#include "cf/exceptions.h"
#include "cf/str_hash.h"

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/list/for_each.hpp>
#include <boost/preprocessor/punctuation/comma.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>

#include <cstring> // std::strlen()
#include <ostream>

//----------------------------------------------------------------------------

#define cf_ENUM_PROLOGUE(name) \
struct name \
{ \
/* */

#define cf_ENUM_EPILOGUE() \
} /* user provides final semicolon */ \
/* */

//............................................................................
/*
 * this is slightly tricky: because the same type of *_FOR_EACH macros are not reentrant,
 * use a list to iterate over options instead of a seq at this nesting level
 */
#define cf_ENUM_OPTIONS(val_seq, .../* opts */) \
    BOOST_PP_LIST_FOR_EACH (cf_ENUM_emit_opt, val_seq, CF_VARIADIC_TO_LIST (__VA_ARGS__)) \
    /* */

#define cf_ENUM_emit_opt(r, val_seq, opt) \
    BOOST_PP_CAT (cf_ENUM_opt_, opt)(val_seq) \
    /* */

//............................................................................

#define CF_ENUM_NA_NAME     "NA"

//............................................................................

#define cf_ENUM_VALUES_value(r, data, val) \
    val BOOST_PP_COMMA () \
    /* */

#define cf_ENUM_VALUES_seq(val_seq) \
    BOOST_PP_SEQ_FOR_EACH (cf_ENUM_VALUES_value, unused, val_seq) \
    /* */

#define cf_ENUM_VALUES(val_seq) \
    enum enum_t : enum_int_t \
    { \
        cf_ENUM_VALUES_seq (val_seq) \
        size, \
        na = ::cf::enum_NA () \
    }; \
    /* */

//............................................................................
// 'iterable':
//............................................................................

#define cf_ENUM_opt_iterable(val_seq) \
    friend enum_t operator++ (enum_t & e) CF_NOEXCEPT \
    { \
        return (e = static_cast<enum_t> (e + 1)); \
    } \
    /* */

//............................................................................
// 'printable':
//............................................................................

#define cf_ENUM_opt_printable(val_seq) \
    static string_literal_t name (enum_t const e) CF_NOEXCEPT \
    { \
        switch (e) \
        { \
            BOOST_PP_SEQ_FOR_EACH (cf_ENUM_opt_printable_case, unused, val_seq) \
          \
            case na: return CF_ENUM_NA_NAME; \
            default: return "??"; \
        } \
    } \
    \
    friend std::ostream & operator<< (std::ostream & os, enum_t const & e) CF_NOEXCEPT \
    { \
        return os << name (e); \
    } \
    /* */

#   define cf_ENUM_opt_printable_case(r, unused, val) \
        case val : return CF_TO_STRING (val) ; \
        /* */

//............................................................................
// 'parsable':
//............................................................................

#define cf_ENUM_opt_parsable(val_seq) \
    static enum_t value (char_const_ptr_t const name, int32_t const name_size) \
    { \
        switch (::cf::str_hash_32 (name, name_size)) \
        { \
            BOOST_PP_SEQ_FOR_EACH (cf_ENUM_opt_parsable_case, unused, val_seq) \
            case "NA"_hash : return na ; \
        } \
        \
        throw_x (::cf::invalid_input, "invalid enum value name '" + std::string (name, name_size) + '\''); \
    } \
    \
    static CF_FORCEINLINE enum_t value (string_literal_t const name) \
    { \
        return value (name, std::strlen (name)); \
    } \
    \
    static CF_FORCEINLINE enum_t value (std::string const & name) \
    { \
        return value (name.data (), name.size ()); \
    } \
    /* */

#   define cf_ENUM_opt_parsable_case(r, unused, val) \
        case BOOST_PP_CAT (CF_TO_STRING (val), _hash) : return val ; \
        /* */

//----------------------------------------------------------------------------
