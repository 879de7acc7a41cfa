#pragma once

#include "cf/strings_fwd.h"

#include <boost/filesystem.hpp>
namespace fs    = boost::filesystem;

//----------------------------------------------------------------------------
namespace cf
{

template<>
inline std::string
print<fs::path> (fs::path const & p)
{
    return '[' + p.native () + ']';
}

} // end of namespace
//----------------------------------------------------------------------------
