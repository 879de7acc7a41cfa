#pragma once

//----------------------------------------------------------------------------
// unary:
//............................................................................

#define cf_is_positive(v) /* 0 < v */ \
    (0 < (v))

#define cf_is_nonnegative(v) /* 0 <= v */ \
    (0 <= (v))

#define cf_is_empty(c) /* c.empty () */ \
    ((c).empty ())

#define cf_is_nonempty(c) /* !(c.empty ()) */ \
    (! cf_is_empty (c))

#define cf_is_nonnull(p) /* p != nullptr */ \
    ((p) != nullptr)

//............................................................................
// binary:
//............................................................................

// for less operator overloading requirements, use only operator< and operator==:

#define cf_eq(lhs, rhs) /* lhs == rhs */ \
    ((lhs) == (rhs))

#define cf_ne(lhs, rhs) /* !(lhs == rhs) */ \
    (! cf_eq (lhs, rhs))

#define cf_lt(lhs, rhs) /* lhs < rhs */ \
    ((lhs) < (rhs))

#define cf_le(lhs, rhs) /* !(rhs < lhs) */ \
    (! cf_lt (rhs, lhs))

#define cf_gt(lhs, rhs) /* rhs < lhs */ \
    cf_lt (rhs, lhs)

#define cf_ge(lhs, rhs) /* !(lhs < rhs) */ \
    (! cf_lt (lhs, rhs))

//............................................................................
// ranges:
//............................................................................

#define cf_is_within(i, limit) /* i in [0, limit) */ \
    (cf_is_nonnegative (i) && cf_lt (i, limit))

#define cf_is_in_inclusive_range(i, a, b) /* i in [a, b] */ \
    (cf_le (a, i) && cf_le (i, b))

//----------------------------------------------------------------------------
