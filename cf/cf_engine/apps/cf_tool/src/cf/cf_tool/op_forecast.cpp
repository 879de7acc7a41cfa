
#include "cf/cf_tool/ops.h"

#include "cf/cf_tool/util/op_common.h"

#include "cf/budget/forecast_projector.h"
#include "cf/budget/io/json_io.h"
#include "cf/budget/post_hierarchy.h"
#include "cf/io/files.h"
#include "cf/settings.h"
#include "cf/util/argparse.h"
#include "cf/util/json.h"
#include "cf/util/logging.h"

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
//............................................................................
namespace
{

struct run_args final
{
    optional<int32_t> const m_months;
    optional<util::month_index_t> const m_first_month;
    optional<budget::amount_t> const m_threshold;

}; // end of class
//............................................................................

/*
 * 'request' is
 *
 *  {
 *      "budget_id": "...", "months": 12,
 *      "posts": [ ... ], "balances": { "<container id>": <amount>, ... }
 *  }
 */
json
run (rt::app_cfg const & config, json const & request, run_args const & args)
{
    settings const fc_cfg = (config.scope_exists ("/forecast") ? config.scope ("/forecast") : settings::object ());

    int32_t const max_months = get_or<int32_t> (fc_cfg, "max_months", 24);
    int32_t const months = (args.m_months ? * args.m_months : get_or<int32_t> (request, "months", 12));

    if (CF_UNLIKELY ((months < 1) || (months > max_months)))
        throw_x (invalid_input, "forecast horizon must be in [1, " + string_cast (max_months) + "] months: " + string_cast (months));

    budget::amount_t const threshold = (args.m_threshold ? * args.m_threshold : get_or<budget::amount_t> (fc_cfg, "large_expense_threshold", 0));
    util::month_index_t const first_month = (args.m_first_month ? * args.m_first_month : util::month_index (config.start_date ()));

    auto const i = request.find ("posts");
    if (CF_UNLIKELY (i == request.end ()))
        throw_x (invalid_input, "request has no \"posts\"");

    // parse and check the hierarchy constraints before projecting:

    budget::post_hierarchy const hierarchy { budget::io::parse_posts (* i) };
    hierarchy.validate ();

    budget::container_balances const balances = budget::io::parse_balances (request.value ("balances", json { }));

    LOG_info << "forecasting budget " << print (get_or<std::string> (request, "budget_id", "?")) << " (" << hierarchy.posts ().size ()
             << " post(s), " << balances.size () << " container(s)) over " << months << " month(s) from " << util::print_month (first_month)
             << ", large expense threshold " << threshold;

    util::date_t const from = util::month_start (first_month);
    util::date_t const to = util::month_end (first_month + months - 1);

    cal::calendar const calendar = make_calendar (config, from, to);
    budget::forecast_projector const fp { calendar, threshold };

    budget::forecast_result const r = fp.project (hierarchy.posts (), balances, first_month, months);

    LOG_info << "  lowest point " << util::print_month (r.m_lowest_month) << ": " << r.m_lowest_balance;

    return budget::io::forecast_to_json (r);
}

} // end of anonymous
//----------------------------------------------------------------------------

int32_t
op_forecast (string_vector const & av)
{
    fs::path cfg_file { };
    fs::path in_file { };
    fs::path out_file { };
    std::string month_str { };

    bpopt::options_description opts { "usage: cf_tool forecast [options] file" };
    opts.add_options ()
        ("cfg,c",       bpopt::value (& cfg_file)->value_name ("FILE"), "configuration file [default: built-in defaults]")
        ("input,i",     bpopt::value (& in_file)->value_name ("FILE")->required (), "forecast request (JSON)")
        ("out,o",       bpopt::value (& out_file)->value_name ("FILE"), "output file [default: stdout]")
        ("months,m",    bpopt::value<int32_t> ()->value_name ("N"), "horizon [default: request's \"months\", else 12]")
        ("month",       bpopt::value (& month_str)->value_name ("YYYY-MM"), "first month [default: session start month]")
        ("threshold",   bpopt::value<int64_t> ()->value_name ("AMOUNT"), "large expense threshold [default: \"/forecast/large_expense_threshold\", else 0]")

        ("help,h",  "print usage information")
        ("version", "print build version")
    ;

    bpopt::positional_options_description popts { };
    popts.add ("input", 1);     // alias 1st positional option

    int32_t rc { };
    try
    {
        CF_ARGPARSE (av, opts, popts);

        std::unique_ptr<rt::app_cfg> const config = load_cfg (cfg_file);

        optional<int32_t> months { };
        optional<util::month_index_t> first_month { };
        optional<budget::amount_t> threshold { };

        if (args.count ("months")) months = args ["months"].as<int32_t> ();
        if (args.count ("threshold")) threshold = args ["threshold"].as<int64_t> ();
        if (! month_str.empty ()) first_month = util::parse_month (month_str);

        LOG_info << "reading " << print (io::absolute_path (in_file)) << " ...";
        json const request = io::read_json (in_file);

        run_args const rargs { months, first_month, threshold };

        emit (run (* config, request, rargs), out_file);
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
