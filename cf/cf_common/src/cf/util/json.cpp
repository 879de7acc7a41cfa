
#include "cf/macros.h"
#include "cf/util/json.h"

#include <boost/preprocessor/seq/for_each.hpp>

//----------------------------------------------------------------------------
namespace cf
{

template<>
std::string
print<json::value_t> (json::value_t const & type)
{
    switch (type)
    {
#   define cf_CASE(r, unused, TYPE) \
        case json::value_t:: TYPE :   return CF_TO_STRING (TYPE); \
        /* */

        BOOST_PP_SEQ_FOR_EACH (cf_CASE, unused, CF_JSON_VALUE_TYPE_SEQ)

#   undef cf_CASE

        default: return "null";

    } // end of switch
}

} // end of namespace
//----------------------------------------------------------------------------
