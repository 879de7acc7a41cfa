#include "cf/cf_tool/ops.h"

#include "cf/str_hash.h"
#include "cf/util/argparse.h"
#include "cf/util/logging.h"
#include "cf/version.h"

//----------------------------------------------------------------------------

CF_APP_MAIN ()
{
    using namespace cf;

    bpopt::options_description opts { "usage: cf_tool [options] <op> [op options]" };
    opts.add_options ()
        ("op",          bpopt::value<std::string> ()->value_name ("<op>")->required (),  "operation ('preview|forecast|non_bank_days')")
        ("op_args",     bpopt::value<string_vector> (),                                  "operation options")

        ("help,h",  "print usage information")
        ("version", "print build version")
    ;

    bpopt::positional_options_description popts { };
    {
        popts.add ("op",        1);     // alias 1st positional option as op name
        popts.add ("op_args",   -1);    // multiple positional args for ops
    }

    int32_t rc { };
    try
    {
        CF_OP_ARGPARSE (ac, av, opts, popts);

        std::string const op { args ["op"].as<std::string> () };
        switch (str_hash_32 (op))
        {
            case "preview"_hash:        rc = op_preview (op_args); break;
            case "forecast"_hash:       rc = op_forecast (op_args); break;
            case "non_bank_days"_hash:  rc = op_non_bank_days (op_args); break;

            default: { rc = 1; std::cerr << "unrecognized op '" << op << "'\n" << opts; }

        } // end of switch
    }
    catch (std::exception const & e)
    {
        rc = 2;
        LOG_error << exc_info (e);
    }

    return rc;
}
//----------------------------------------------------------------------------
