
#include "cf/test/utility.h"

#include "cf/io/files.h"
#include "cf/strings.h"
#include "cf/util/env.h"
#include "cf/util/logging.h"
#include "cf/util/singleton.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace test
{
//............................................................................

void
env::SetUp ()
{
    // unless disabled, clean temp dir used by testcases:

    fs::path const test_temp_dir = test::temp_dir ();

    if ("no" != util::getenv (CF_ENV_TEST_TEMP_CLEAN))
    {
        LOG_trace1 << "cleaning [" << test_temp_dir.native () << "] ...";

        io::clean_dir (test_temp_dir, false);
    }
    else
    {
        LOG_warn << "retaining contents of [" << test_temp_dir.native () << "] ...";
    }
}

void
env::TearDown ()
{
    LOG_info << "test temp dir: " << print (test::temp_dir ());
}
//............................................................................
//............................................................................
namespace
{

struct temp_dir_factory
{
    static fs::path * create ()
    {
        std::string const name { join_as_name (CF_APP_NAME, util::getenv<std::string> ("USER")) };
        std::unique_ptr<fs::path> r { new fs::path { io::temp_dir () / name CF_IF_RELEASE (/ "release") } };

        LOG_info << "test temp dir: " << print (* r);

        return r.release ();
    }

}; // end of class

} // end of anonymous
//............................................................................
//............................................................................

std::string
current_test_name ()
{
    auto const * const ti = gt::UnitTest::GetInstance ()->current_test_info ();

    return (ti ? join_as_name (ti->test_case_name (), ti->name ()) : "");
}

fs::path
temp_dir ()
{
    return util::singleton<fs::path, temp_dir_factory>::instance ();
}

fs::path
unique_test_path (std::string const & name_suffix)
{
    return io::unique_path (temp_dir () / current_test_name (), name_suffix);
}

} // end of 'test'
} // end of namespace
//----------------------------------------------------------------------------
