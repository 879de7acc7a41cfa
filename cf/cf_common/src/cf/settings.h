#pragma once

#include "cf/asserts.h"
#include "cf/settings_fwd.h"
#include "cf/util/json.h"

//----------------------------------------------------------------------------
namespace cf
{
/**
 * @return 'cfg [key]' converted to 'T' if present, 'dflt' otherwise
 *
 * @throws type_mismatch if the value is present but not convertible to 'T'
 */
template<typename T>
T
get_or (settings const & cfg, std::string const & key, T const & dflt)
{
    check_condition (cfg.is_object () || cfg.is_null (), print (cfg.type ()), key);

    auto const i = cfg.find (key);
    if (i == cfg.end () || i->is_null ())
        return dflt;

    try
    {
        return i->template get<T> ();
    }
    catch (std::exception const & e)
    {
        chain_x (type_mismatch, "failed to convert setting " + print (key) + " (" + print (i->type ()) + ')');
    }

    CF_ASSUME_UNREACHABLE ();
}

} // end of namespace
//----------------------------------------------------------------------------
