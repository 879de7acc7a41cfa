#pragma once

#include "cf/types.h"

//----------------------------------------------------------------------------
namespace cf
{

extern int32_t
op_preview (string_vector const & av);

extern int32_t
op_forecast (string_vector const & av);

extern int32_t
op_non_bank_days (string_vector const & av);

} // end of namespace
//----------------------------------------------------------------------------
