#pragma once

#include "cf/types.h"

#include <cstring>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
//............................................................................
namespace impl
{
/*
 * 32-bit FNV-1a, usable in both constant and runtime contexts
 */
constexpr uint32_t fnv1a_32_basis ()    { return 2166136261U; }
constexpr uint32_t fnv1a_32_prime ()    { return 16777619U; }

constexpr uint32_t
fnv1a_32 (char_const_ptr_t const str, std::size_t const len)
{
    uint32_t h = fnv1a_32_basis ();

    for (std::size_t i = 0; i < len; ++ i)
    {
        h ^= static_cast<uint8_t> (str [i]);
        h *= fnv1a_32_prime ();
    }

    return h;
}

} // end of 'impl'
//............................................................................
//............................................................................
/**
 * a user-defined string literal for static string hashing, to be used together
 * with @ref str_hash_32() along the lines of:
 * @code
 *   switch (str_hash_32 (s))
 *   {
 *      case "preview"_hash:  ...;
 *
 *      case "forecast"_hash: ...;
 *      ...
 *   }
 * @endcode
 */
constexpr uint32_t
operator "" _hash (char_const_ptr_t const str, std::size_t const len)
{
    return impl::fnv1a_32 (str, len);
}
//............................................................................
/**
 * dynamically compute the same hash value as @ref _hash()
 *
 * @param str [does not need to be 0-terminated]
 * @param len number of chars in 'str' to hash
 */
inline uint32_t
str_hash_32 (char_const_ptr_t const str, int32_t const len)
{
    return impl::fnv1a_32 (str, len);
}

/**
 * @param str [must be 0-terminated]
 */
inline uint32_t
str_hash_32 (string_literal_t const str)
{
    return str_hash_32 (str, std::strlen (str));
}

inline uint32_t
str_hash_32 (std::string const & str)
{
    return str_hash_32 (str.data (), str.size ());
}

} // end of namespace
//----------------------------------------------------------------------------
