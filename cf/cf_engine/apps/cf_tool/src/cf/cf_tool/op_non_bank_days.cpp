
#include "cf/cf_tool/ops.h"

#include "cf/cf_tool/util/op_common.h"

#include "cf/budget/io/json_io.h"
#include "cf/budget/timeline_preview.h"
#include "cf/util/argparse.h"
#include "cf/util/json.h"
#include "cf/util/logging.h"

//----------------------------------------------------------------------------
namespace cf
{

int32_t
op_non_bank_days (string_vector const & av)
{
    fs::path cfg_file { };
    fs::path out_file { };
    std::string from_str { };
    std::string to_str { };

    bpopt::options_description opts { "usage: cf_tool non_bank_days [options]" };
    opts.add_options ()
        ("cfg,c",       bpopt::value (& cfg_file)->value_name ("FILE"), "configuration file [default: built-in defaults]")
        ("out,o",       bpopt::value (& out_file)->value_name ("FILE"), "output file [default: stdout]")
        ("from,f",      bpopt::value (& from_str)->value_name ("DATE")->required (), "range start")
        ("to,t",        bpopt::value (& to_str)->value_name ("DATE")->required (), "range end (at most a year after start)")

        ("help,h",  "print usage information")
        ("version", "print build version")
    ;

    bpopt::positional_options_description popts { };
    popts.add ("from", 1);
    popts.add ("to", 1);

    int32_t rc { };
    try
    {
        CF_ARGPARSE (av, opts, popts);

        std::unique_ptr<rt::app_cfg> const config = load_cfg (cfg_file);

        util::date_t const from = util::parse_date (from_str);
        util::date_t const to = util::parse_date (to_str);

        cal::calendar const calendar = make_calendar (* config, from, to);
        budget::timeline_preview const tp { calendar };

        emit (budget::io::dates_to_json (tp.non_bank_days (from, to)), out_file);
    }
    catch (std::exception const & e)
    {
        rc = 2;
        LOG_error << exc_info (e);
    }

    return rc;
}

} // end of namespace
//----------------------------------------------------------------------------
