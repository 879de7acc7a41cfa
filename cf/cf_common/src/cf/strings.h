#pragma once

#include "cf/macros.h"
#include "cf/strings_fwd.h"
#include "cf/util/type_traits.h"

#include <cstring>
#include <iterator>
#include <sstream>
#include <utility>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................

template<char QUOTE>
std::string
quote_string (string_literal_t const s)
{
    auto const s_len = std::strlen (s);

    std::string r (s_len + 2, QUOTE);
    std::memcpy (& r [1], s, s_len);

    return r;
}

template<char QUOTE>
std::string
quote_string (std::string const & s)
{
    return (QUOTE + s + QUOTE);
}
//............................................................................
//............................................................................
namespace impl
{

template<typename T, typename = void>
struct string_cast_impl
{
    static CF_NORETURN std::string evaluate (T const & x)
    {
        static_assert (util::lazy_false<T>::value, "'T' is not streamable");
    }

}; // end of master


template<typename T>
struct string_cast_impl<T,
    typename std::enable_if<util::is_std_string<T>::value>::type>
{
    static CF_FORCEINLINE std::string const & evaluate (std::string const & s)
    {
        return s;
    }

}; // end of specialization

template<typename T> // finally, use operator<< if available
struct string_cast_impl<T,
    typename std::enable_if<(! util::is_std_string<T>::value && util::is_streamable<T, std::stringstream>::value)>::type>
{
    static std::string evaluate (T const & x)
    {
        std::stringstream s;
        s << x;

        return s.str ();
    }

}; // end of specialization

} // end of 'impl'
//............................................................................
//............................................................................

template<typename T>
auto
string_cast (T const & x) -> decltype (impl::string_cast_impl<T>::evaluate (x))
{
    return impl::string_cast_impl<T>::evaluate (x);
}
//............................................................................
//............................................................................
namespace impl
{

template<typename T, typename = void>
struct print_impl
{
    static std::string evaluate (T const & x)
    {
        return string_cast (x); // default to 'string_cast' (which will likely require 'T' to be streamable)
    }

}; // end of master


template<typename T>
struct print_impl<T,
    typename util::enable_if_is_same<string_literal_t, T>::type> // specialize for C-style strings
{
    static std::string evaluate (string_literal_t const s)
    {
        return quote_string<'"'> (s);
    }

}; // end of specialization

template<typename T>
struct print_impl<T,
    typename util::enable_if_is_same<std::string, T>::type> // specialized for 'std::string'
{
    static std::string evaluate (std::string const & s)
    {
        return quote_string<'"'> (s);
    }

}; // end of specialization

template<typename T>
struct print_impl<T,
    typename util::enable_if_is_same<char, T>::type>
{
    static std::string evaluate (char const & c)
    {
        std::string r { "'?'" };
        r [1] = c;

        return r;
    }

}; // end of specialization

template<typename T>
struct print_impl<T,
    typename util::enable_if_is_same<int8_t, T>::type>
{
    static std::string evaluate (int8_t const & x)
    {
        return print_impl<int32_t>::evaluate (x); // cast to 'int32_t'
    }

}; // end of specialization

template<typename T>
struct print_impl<T,
    typename util::enable_if_is_same<uint8_t, T>::type>
{
    static std::string evaluate (uint8_t const & x)
    {
        return print_impl<uint32_t>::evaluate (x); // cast to 'uint32_t'
    }

}; // end of specialization

// std::pair:

template<typename T>
struct print_impl<T,
    typename std::enable_if<util::is_pair<T>::value>::type>
{
    static std::string evaluate (T const & p)
    {
        std::stringstream s { };

        s << '{' << print (p.first) << ':' << print (p.second) << '}';

        return s.str ();
    }

}; // end of specialization

// containers:

template<typename C>
struct print_impl<C, // otherwise check if it's iterable (but not 'std::string')
    typename std::enable_if<(util::is_iterable<C>::value && ! util::is_std_string<C>::value && ! util::is_streamable<C, std::stringstream>::value)>::type>
{
    static std::string evaluate (C const & c)
    {
        std::stringstream s { };
        s << '{';
        {
            bool first = true;
            for (auto i = std::begin (c), i_limit = std::end (c); i != i_limit; ++ i, first = false)
            {
                if (! first) s << ", ";
                s << print (* i); // recurse
            }
        }
        s << '}';

        return s.str ();
    }

}; // end of specialization
//............................................................................

template<char SEP, typename ... ARGs>
struct join_as_name_impl; // master


template<char SEP> // recursion ends
struct join_as_name_impl<SEP>
{
    static void evaluate (std::ostream &, bool const)
    {
    }

}; // end of specialization

template<char SEP, typename T, typename ... ARGs>
struct join_as_name_impl<SEP, T, ARGs ...>
{
    static void evaluate (std::ostream & out, bool not_first, T && x, ARGs && ... args)
    {
        auto const x_str = string_cast (x);

        if (! x_str.empty ())
        {
            if (not_first) out << SEP;
            out << x_str;

            not_first = true;
        }

        join_as_name_impl<SEP, ARGs ...>::evaluate (out, not_first, std::forward<ARGs> (args) ...);
    }

}; // end of specialization

} // end of 'impl'
//............................................................................
//............................................................................
/**
 * @return a "human-friendly" stringified representation of 'x'
 */
template<typename T>
std::string
print (T const & x)
{
    return impl::print_impl<T>::evaluate (x);
}

template<std::size_t N> // overload for string literals
std::string
print (char const (& s) [N])
{
    std::string r (N + 1, '"');
    std::memcpy (& r [1], s, N - 1);

    return r;
}
//............................................................................
/**
 * @return a string that is a SEP-separated list of 'args' as stringized by 'string_cast'
 *         (with any resulting empty strings elided)
 */
template<char SEP = '.', typename ... ARGs>
std::string
join_as_name (ARGs && ... args)
{
    std::stringstream os;
    {
        impl::join_as_name_impl<SEP, ARGs ...>::evaluate (os, false, std::forward<ARGs> (args) ...);
    }
    return os.str ();
}

} // end of namespace
//----------------------------------------------------------------------------
