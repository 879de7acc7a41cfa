#include "cf/test/utility.h"
#include "cf/version.h"

//----------------------------------------------------------------------------

CF_APP_MAIN ()
{
    gt::InitGoogleTest (& ac, av);
    gt::AddGlobalTestEnvironment (new cf::test::env { });

    return RUN_ALL_TESTS ();
}
//----------------------------------------------------------------------------
