
#include "cf/cf_tool/util/op_common.h"

#include "cf/io/files.h"
#include "cf/settings.h"
#include "cf/util/json.h"
#include "cf/util/logging.h"

#include <iostream>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
namespace
{

constexpr int32_t calendar_padding_months ()    { return 2; }

} // end of anonymous
//............................................................................

std::unique_ptr<rt::app_cfg>
load_cfg (fs::path const & file)
{
    if (file.empty ())
        return std::make_unique<rt::app_cfg> (settings::object ());

    LOG_info << "loading configuration from " << print (io::absolute_path (file)) << " ...";

    return std::make_unique<rt::app_cfg> (file);
}

cal::calendar
make_calendar (rt::app_cfg const & cfg, util::date_t const & from, util::date_t const & to)
{
    settings const cal_cfg = (cfg.scope_exists ("/calendar") ? cfg.scope ("/calendar") : settings::object ());

    util::date_t const first = from - gd::months (calendar_padding_months ());
    util::date_t const last = to + gd::months (calendar_padding_months ());

    LOG_info << "calendar snapshot [" << first << ", " << last << "], country " << print (get_or<std::string> (cal_cfg, "country", "DK"));

    return { cal_cfg, first, last };
}

void
emit (json const & j, fs::path const & out)
{
    if (out.empty ())
    {
        std::cout << j.dump (4) << std::endl;
    }
    else
    {
        io::write_json (j, out);
        LOG_info << "wrote " << print (io::absolute_path (out));
    }
}

} // end of namespace
//----------------------------------------------------------------------------
