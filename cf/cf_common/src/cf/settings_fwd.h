#pragma once

#include <string>

#include "cf/util/json_fwd.h"

//----------------------------------------------------------------------------
namespace cf
{

using settings      = json;
using scope_path    = std::string; // use an alias just for code clarity

} // end of namespace
//----------------------------------------------------------------------------
