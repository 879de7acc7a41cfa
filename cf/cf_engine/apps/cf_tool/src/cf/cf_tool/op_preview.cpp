
#include "cf/cf_tool/ops.h"

#include "cf/cf_tool/util/op_common.h"

#include "cf/budget/io/json_io.h"
#include "cf/budget/timeline_preview.h"
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

/*
 * 'request' is '{ "patterns": [ ... ], "from": "YYYY-MM-DD", "to": "YYYY-MM-DD" }'
 */
util::date_t
window_bound (json const & request, std::string const & key)
{
    std::string const s = get_or<std::string> (request, key, { });
    if (CF_UNLIKELY (s.empty ()))
        throw_x (invalid_input, "request has no " + print (key) + " and no override was given");

    return util::parse_date (s);
}

/*
 * 'request' is '{ "patterns": [ ... ], "from": "YYYY-MM-DD", "to": "YYYY-MM-DD" }'
 */
json
run (rt::app_cfg const & config, json const & request, optional<util::date_t> from, optional<util::date_t> to)
{
    if (! from) from = window_bound (request, "from");
    if (! to) to = window_bound (request, "to");

    auto const i = request.find ("patterns");
    if (CF_UNLIKELY (i == request.end ()))
        throw_x (invalid_input, "request has no \"patterns\"");

    budget::amount_pattern_vector const patterns = budget::io::parse_patterns (* i);

    LOG_info << "previewing " << patterns.size () << " pattern(s) over [" << * from << ", " << * to << "] ...";

    cal::calendar const calendar = make_calendar (config, * from, * to);
    budget::timeline_preview const tp { calendar };

    budget::occurrence_vector const occurrences = tp.preview (patterns, * from, * to);
    std::vector<util::date_t> const closed = tp.shading_days (* from, * to);

    LOG_info << "  " << occurrences.size () << " occurrence(s), " << closed.size () << " non-bank day(s)";

    return budget::io::preview_to_json (occurrences, closed);
}

} // end of anonymous
//----------------------------------------------------------------------------

int32_t
op_preview (string_vector const & av)
{
    fs::path cfg_file { };
    fs::path in_file { };
    fs::path out_file { };
    std::string from_str { };
    std::string to_str { };

    bpopt::options_description opts { "usage: cf_tool preview [options] file" };
    opts.add_options ()
        ("cfg,c",       bpopt::value (& cfg_file)->value_name ("FILE"), "configuration file [default: built-in defaults]")
        ("input,i",     bpopt::value (& in_file)->value_name ("FILE")->required (), "preview request (JSON)")
        ("out,o",       bpopt::value (& out_file)->value_name ("FILE"), "output file [default: stdout]")
        ("from,f",      bpopt::value (& from_str)->value_name ("DATE"), "window start [default: request's \"from\"]")
        ("to,t",        bpopt::value (& to_str)->value_name ("DATE"), "window end [default: request's \"to\"]")

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

        optional<util::date_t> from { };
        optional<util::date_t> to { };

        if (! from_str.empty ()) from = util::parse_date (from_str);
        if (! to_str.empty ()) to = util::parse_date (to_str);

        LOG_info << "reading " << print (io::absolute_path (in_file)) << " ...";
        json const request = io::read_json (in_file);

        emit (run (* config, request, from, to), out_file);
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
