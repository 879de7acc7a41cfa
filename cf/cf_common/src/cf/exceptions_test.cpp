
#include "cf/exceptions.h"

#include "cf/util/datetime.h"
#include "cf/util/logging.h"

#include "cf/test/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
//............................................................................
namespace
{

template<typename X>
void
raise ()
{
    throw_x (X, "x");
}

} // end of anonymous
//............................................................................
//............................................................................

TEST (exceptions, message_context)
{
    try
    {
        throw_x (invalid_input, "invalid window [2024-02-01, 2024-01-31]");
    }
    catch (invalid_input const & e)
    {
        std::string const msg { e.what () };
        LOG_trace1 << msg;

        EXPECT_NE (msg.find ("exceptions_test.cpp:"), std::string::npos) << msg;
        EXPECT_NE (msg.find ("invalid window [2024-02-01, 2024-01-31]"), std::string::npos) << msg;
    }
}

TEST (exceptions, hierarchy)
{
    // request errors are all 'invalid_input', the rest is not:

    EXPECT_THROW (raise<check_failure> (), invalid_input);
    EXPECT_THROW (raise<out_of_bounds> (), invalid_input);
    EXPECT_THROW (raise<type_mismatch> (), invalid_input);
    EXPECT_THROW (raise<parse_failure> (), invalid_input);

    EXPECT_THROW (raise<illegal_state> (), app_exception);
    EXPECT_THROW (raise<io_exception> (), app_exception);

    try
    {
        raise<io_exception> ();
    }
    catch (invalid_input const &)
    {
        FAIL () << "io_exception is not invalid_input";
    }
    catch (io_exception const &)
    {
    }
}

TEST (exceptions, nested_cause)
{
    try
    {
        util::parse_date ("2024-13-45");
        FAIL () << "expected an exception";
    }
    catch (parse_failure const & e)
    {
        std::stringstream ss { };
        ss << exc_info (e);

        std::string const s = ss.str ();
        LOG_trace1 << s;

        EXPECT_NE (s.find ("failed to parse \"2024-13-45\" as date"), std::string::npos) << s;
        EXPECT_NE (s.find (CF_EXC_CAUSE), std::string::npos) << s;
    }
}

} // end of namespace
//----------------------------------------------------------------------------
