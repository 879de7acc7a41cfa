#pragma once

#include "cf/types.h"

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
/**
 * [c++17]
 */
template<typename T>
using optional                      = boost::optional<T>;

using boost::none;

//............................................................................
/**
 * @return 'c' sorted and with duplicates removed
 */
template<typename C>
C
sorted_unique (C c)
{
    std::sort (c.begin (), c.end ());
    c.erase (std::unique (c.begin (), c.end ()), c.end ());

    return c;
}

} // end of namespace
//----------------------------------------------------------------------------
