
#include "cf/enums.h"

#include "cf/asserts.h"
#include "cf/operators.h"
#include "cf/util/logging.h"

#include "cf/test/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
//............................................................................
namespace
{

CF_ENUM (wire_kind, (dated, period), iterable, printable, parsable);
cf_static_assert (wire_kind::dated == 0);
cf_static_assert (wire_kind::size == 2);

} // end of anonymous
//............................................................................
//............................................................................

TEST (enums, wire_names)
{
    // every option parses back from its printed name:

    int32_t count { };
    for (wire_kind::enum_t e = wire_kind::dated; e != wire_kind::size; ++ e, ++ count)
    {
        EXPECT_EQ (wire_kind::value (print (e)), e);
    }
    EXPECT_EQ (count, 2);

    EXPECT_EQ (print (wire_kind::period), "period");
    EXPECT_EQ (print (rop::GE), "GE");
}

TEST (enums, unknown_wire_name)
{
    EXPECT_THROW (wire_kind::value ("monthly"), invalid_input);
    EXPECT_THROW (wire_kind::value ("Dated"), invalid_input);
    EXPECT_THROW (wire_kind::value (""), invalid_input);
}

} // end of namespace
//----------------------------------------------------------------------------
