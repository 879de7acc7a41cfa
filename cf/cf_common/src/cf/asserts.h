#pragma once

#include "cf/exceptions.h"
#include "cf/strings.h"
#include "cf/util/conditions.h"

//----------------------------------------------------------------------------

#define cf_static_assert(...) static_assert (__VA_ARGS__, #__VA_ARGS__)

//............................................................................
// NOTE: all of these throw 'invalid_input' (or derivatives) on failure:
//............................................................................

// evaluated in both release and debug builds:

#define check_condition(condition, /* extra context */...) \
    do { if (CF_UNLIKELY (! (condition))) \
        throw_x (::cf::check_failure, "failed: (" CF_TO_STRING (condition) ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

/**
 * i in [0, limit)
 */
#define check_within(i, limit, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_within (i, limit)))) \
        throw_x (::cf::out_of_bounds, "failed: expected " CF_TO_STRING (i) " (" + ::cf::print (i) + ") in [0, " + ::cf::print (limit) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

/**
 * i in [a, b]
 */
#define check_in_inclusive_range(i, a, b, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_in_inclusive_range (i, a, b)))) \
        throw_x (::cf::out_of_bounds, "failed: expected " CF_TO_STRING (i) " (" + ::cf::print (i) + ") in [" + ::cf::print (a) + ", " + ::cf::print (b) + "]" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */


#define check_positive(v, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_positive (v)))) \
        throw_x (::cf::invalid_input, "failed: expected positive " CF_TO_STRING (v) " (" + ::cf::print (v) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_nonnegative(v, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_nonnegative (v)))) \
        throw_x (::cf::invalid_input, "failed: expected nonnegative " CF_TO_STRING (v) " (" + ::cf::print (v) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */


#define check_eq(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_eq (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") == " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_ne(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_ne (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") != " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_lt(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_lt (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") < " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_le(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_le (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") <= " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_gt(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_gt (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") > " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_ge(lhs, rhs, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_ge (lhs, rhs)))) \
        throw_x (::cf::invalid_input, "failed: expected " CF_TO_STRING (lhs) " (" + ::cf::print (lhs) + ") >= " CF_TO_STRING (rhs) + " (" + ::cf::print (rhs) + ")" \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */


#define check_nonnull(v, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_nonnull (v)))) \
        throw_x (::cf::invalid_input, "failed: expected nonnull " CF_TO_STRING (v) \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

#define check_nonempty(c, /* extra context */...) \
    do { if (CF_UNLIKELY (! (cf_is_nonempty (c)))) \
        throw_x (::cf::invalid_input, "failed: expected nonempty " CF_TO_STRING (c) \
            cf_expand_exp_list (__VA_ARGS__) ); } while (false) \
    /* */

//............................................................................

// evaluated in debug builds only:

#if !defined (NDEBUG)

#   define assert_condition(condition, ...)             check_condition(condition, __VA_ARGS__)

#   define assert_within(i, limit, ...)                 check_within(i, limit, __VA_ARGS__)
#   define assert_in_inclusive_range(i, a, b, ...)      check_in_inclusive_range(i, a, b, __VA_ARGS__)

#   define assert_positive(v, ...)                      check_positive(v, __VA_ARGS__)
#   define assert_nonnegative(v, ...)                   check_nonnegative(v, __VA_ARGS__)

#   define assert_nonnull(p, ...)                       check_nonnull(p, __VA_ARGS__)
#   define assert_nonempty(c, ...)                      check_nonempty(c, __VA_ARGS__)

#   define assert_eq(lhs, rhs, ...)                     check_eq(lhs, rhs, __VA_ARGS__)
#   define assert_ne(lhs, rhs, ...)                     check_ne(lhs, rhs, __VA_ARGS__)
#   define assert_lt(lhs, rhs, ...)                     check_lt(lhs, rhs, __VA_ARGS__)
#   define assert_le(lhs, rhs, ...)                     check_le(lhs, rhs, __VA_ARGS__)
#   define assert_gt(lhs, rhs, ...)                     check_gt(lhs, rhs, __VA_ARGS__)
#   define assert_ge(lhs, rhs, ...)                     check_ge(lhs, rhs, __VA_ARGS__)

#else // elided in release builds:

#   define assert_condition(condition, ...)

#   define assert_within(i, limit, ...)
#   define assert_in_inclusive_range(i, a, b, ...)

#   define assert_positive(v, ...)
#   define assert_nonnegative(v, ...)

#   define assert_nonnull(p, ...)
#   define assert_nonempty(c, ...)

#   define assert_eq(lhs, rhs, ...)
#   define assert_ne(lhs, rhs, ...)
#   define assert_lt(lhs, rhs, ...)
#   define assert_le(lhs, rhs, ...)
#   define assert_gt(lhs, rhs, ...)
#   define assert_ge(lhs, rhs, ...)

#endif // NDEBUG

//----------------------------------------------------------------------------
