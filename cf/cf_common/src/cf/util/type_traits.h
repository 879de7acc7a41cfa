#pragma once

#include "cf/types.h"

#include <iterator>
#include <utility>

//----------------------------------------------------------------------------
namespace cf
{
namespace util
{
//............................................................................

template<bool B>
using bool_constant         = std::integral_constant<bool, B>;

template<typename T>
struct lazy_false: std::false_type
{
}; // end of metafunction

template<typename ... Ts>
struct make_void
{
    using type              = void;

}; // end of metafunction

template<typename ... Ts>
using void_t                = typename make_void<Ts ...>::type;

//............................................................................

template<typename T, typename U>
using enable_if_is_same     = std::enable_if<std::is_same<T, U>::value>;

template<typename T>
using is_std_string         = std::is_same<std::string, typename std::decay<T>::type>;

//............................................................................

template<typename T, typename = void>
struct is_pair: std::false_type
{
}; // end of master

template<typename T>
struct is_pair<T,
    void_t<typename T::first_type, typename T::second_type> >: std::true_type
{
}; // end of specialization
//............................................................................

template<typename T, typename S, typename = void>
struct is_streamable: std::false_type
{
}; // end of master

template<typename T, typename S>
struct is_streamable<T, S,
    void_t<decltype (std::declval<S &> () << std::declval<T const &> ())> >: std::true_type
{
}; // end of specialization
//............................................................................

template<typename T, typename = void>
struct is_iterable: std::false_type
{
}; // end of master

template<typename T>
struct is_iterable<T,
    void_t<decltype (std::begin (std::declval<T const &> ())), decltype (std::end (std::declval<T const &> ()))> >: std::true_type
{
}; // end of specialization

} // end of 'util'
} // end of namespace
//----------------------------------------------------------------------------
