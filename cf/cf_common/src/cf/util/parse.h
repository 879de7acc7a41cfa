#pragma once

#include "cf/types.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace util
{

/**
 * @param separators any of these chars separates tokens
 */
extern string_vector
split (std::string const & s, string_literal_t const separators, bool keep_empty_tokens = false);

} // end of 'util'
} // end of namespace
//----------------------------------------------------------------------------
