#pragma once

#include "cf/enums.h"
#include "cf/str_hash.h"

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................

#define CF_ROP_SEQ  \
        (LT)        \
        (LE)        \
        (EQ)        \
        (GE)        \
        (GT)        \
    /* */

CF_ENUM (rop,
    (
        BOOST_PP_SEQ_ENUM (CF_ROP_SEQ)
    ),
    printable, parsable

); // end of enum

constexpr rop::enum_t
operator "" _rop (char_const_ptr_t const str, std::size_t const len)
{
    switch (operator "" _hash (str, len))
    {
        case  "<"_hash: return rop::LT;
        case "<="_hash: return rop::LE;
        case "=="_hash: return rop::EQ;
        case ">="_hash: return rop::GE;
        case  ">"_hash: return rop::GT;

        default: return rop::na;

    } // end of switch
}

} // end of namespace
//----------------------------------------------------------------------------
