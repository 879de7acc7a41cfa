#pragma once

#include "cf/config.h" // _GNU_SOURCE

#include <boost/call_traits.hpp>
#include <boost/noncopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <vector>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................

using std::int64_t;
using std::int32_t;
using std::int16_t;
using std::int8_t;

using std::uint64_t;
using std::uint32_t;
using std::uint16_t;
using std::uint8_t;

//............................................................................

using string_literal_t      = char const *; // 0-terminated
using char_const_ptr_t      = char const *; // not necessarily 0-terminated

using signed_size_t         = std::make_signed<std::size_t>::type;

using enum_int_t            = uint32_t;

//............................................................................

using string_vector         = std::vector<std::string>;

//............................................................................

using noncopyable           = boost::noncopyable;

//............................................................................

template<typename T, std::size_t N>
constexpr std::size_t
length (T (&)[N])
{
    return N;
}
//............................................................................

template<typename T>
struct call_traits: public boost::call_traits<T>
{
    using param             = typename boost::call_traits<T>::param_type; // less typing

}; // end of metafunction
//............................................................................

constexpr enum_int_t enum_NA () { return -1; }

} // end of namespace
//----------------------------------------------------------------------------
