
#include "cf/rt/cfg/app_cfg.h"

#include "cf/io/files.h"
#include "cf/settings.h"
#include "cf/util/logging.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace rt
{
//............................................................................

static const scope_path g_time_path { "/app_cfg/time" };

//............................................................................

struct app_cfg::pimpl final
{
    pimpl (fs::path const & source)
    {
        LOG_trace1 << "loading cfg from " << print (source) << " ...";

        m_root = io::read_json (source);
        initialize ();
    }

    pimpl (settings const & cfg) :
        m_root (cfg) // deep copy
    {
        initialize ();
    }

    pimpl (settings && cfg) :
        m_root (std::move (cfg))
    {
        initialize ();
    }

    void initialize ();


    bool scope_exists (scope_path const & path) const
    {
        return m_root.contains (json::json_pointer { path });
    }

    settings const & scope (scope_path const & path) const
    {
        LOG_trace2 << "looking up scope " << print (path);
        try
        {
            return m_root.at (json::json_pointer { path });
        }
        catch (std::exception const & e)
        {
            chain_x (invalid_input, "failed to look up scope path " + print (path));
        }

        CF_ASSUME_UNREACHABLE (path);
    }


    util::ptime_t m_start_time { };
    settings m_root { };

}; // end of nested class
//............................................................................

void
app_cfg::pimpl::initialize ()
{
    m_start_time = scope_exists (g_time_path)
        ? util::parse_ptime (scope (g_time_path).get<std::string> ())
        : util::current_time_local ();

    LOG_trace1 << "[session: " << m_start_time << "] loaded cfg " << print (m_root.type ()) << " with " << m_root.size () << " root children";
    LOG_trace2 << '\n' << print (m_root);
}
//............................................................................

app_cfg::app_cfg (fs::path const & source) :
    m_impl { std::make_unique<pimpl> (source) }
{
}

app_cfg::app_cfg (settings const & cfg) :
    m_impl { std::make_unique<pimpl> (cfg) }
{
}

app_cfg::app_cfg (settings && cfg) :
    m_impl { std::make_unique<pimpl> (std::move (cfg)) }
{
}

app_cfg::~app_cfg ()    = default; // pimpl
//............................................................................

settings const &
app_cfg::root () const
{
    return m_impl->m_root;
}

bool
app_cfg::scope_exists (scope_path const & path) const
{
    return m_impl->scope_exists (path);
}

settings const &
app_cfg::scope (scope_path const & path) const
{
    return m_impl->scope (path);
}
//............................................................................

util::date_t
app_cfg::start_date () const
{
    return m_impl->m_start_time.date ();
}

util::ptime_t const &
app_cfg::start_time () const
{
    return m_impl->m_start_time;
}

} // end of 'rt'
} // end of namespace
//----------------------------------------------------------------------------
