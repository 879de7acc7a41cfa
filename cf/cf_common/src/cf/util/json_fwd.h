#pragma once

#include "cf/strings_fwd.h"

#include <nlohmann/json_fwd.hpp>

//----------------------------------------------------------------------------
namespace cf
{
using json          = nlohmann::json;

//............................................................................

template<>
std::string
print<json> (json const & j);

} // end of namespace
//----------------------------------------------------------------------------
