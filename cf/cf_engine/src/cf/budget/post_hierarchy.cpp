
#include "cf/budget/post_hierarchy.h"

#include "cf/util/logging.h"

#include <algorithm>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
//............................................................................
namespace
{

bool
contains (container_id_vector const & c, container_id const & id)
{
    return (std::find (c.begin (), c.end (), id) != c.end ());
}

bool
is_subset (container_id_vector const & sub, container_id_vector const & super)
{
    return std::all_of (sub.begin (), sub.end (), [&](container_id const & id) { return contains (super, id); });
}

/*
 * elements of 'lhs' (in 'lhs' order) that are also in 'rhs', or all of 'rhs' if there are none
 */
container_id_vector
narrow (container_id_vector const & lhs, container_id_vector const & rhs)
{
    container_id_vector r { };

    for (container_id const & id : lhs)
    {
        if (contains (rhs, id)) r.push_back (id);
    }

    if (r.empty ()) r = rhs;

    return r;
}

bool
is_strict_prefix (string_vector const & prefix, string_vector const & path)
{
    return ((prefix.size () < path.size ()) && std::equal (prefix.begin (), prefix.end (), path.begin ()));
}

void
narrow_patterns (budget_post & post)
{
    for (amount_pattern & p : post.m_patterns)
    {
        if (! p.m_container_ids.empty ())
            p.m_container_ids = narrow (p.m_container_ids, post.m_container_ids);
    }
}

} // end of anonymous
//............................................................................
//............................................................................

std::ostream &
operator<< (std::ostream & os, post_hierarchy::change const & obj)
{
    return os << '{' << print (obj.m_post_id) << ": " << print (obj.m_old) << " -> " << print (obj.m_new) << '}';
}
//............................................................................

post_hierarchy::post_hierarchy (budget_post_vector posts) :
    m_posts (std::move (posts))
{
    for (int32_t i = 0, i_limit = m_posts.size (); i < i_limit; ++ i)
    {
        budget_post const & p = m_posts [i];

        if (CF_UNLIKELY (! m_id_index.emplace (p.m_id, i).second))
            throw_x (invalid_input, "duplicate post id " + print (p.m_id));

        if (p.m_direction == direction::transfer)
            continue;

        if (CF_UNLIKELY (p.m_category_path.empty ()))
            throw_x (invalid_input, "post " + print (p.m_id) + " has no category path");

        if (CF_UNLIKELY (! m_path_index.emplace (std::make_pair (p.m_direction, p.m_category_path), i).second))
            throw_x (invalid_input, "duplicate " + string_cast (p.m_direction) + " post for category " + print (p.m_category_path));
    }
}
//............................................................................

int32_t
post_hierarchy::index_of (std::string const & id) const
{
    auto const i = m_id_index.find (id);
    if (CF_UNLIKELY (i == m_id_index.end ()))
        throw_x (invalid_input, "no post with id " + print (id));

    return i->second;
}

int32_t
post_hierarchy::ancestor_of (int32_t const i) const
{
    auto const ci = m_ancestor_cache.find (i);
    if (ci != m_ancestor_cache.end ())
        return ci->second;

    int32_t r { -1 };

    budget_post const & p = m_posts [i];
    if (p.m_direction != direction::transfer)
    {
        string_vector prefix { p.m_category_path };

        while (prefix.size () > 1)
        {
            prefix.pop_back ();

            auto const pi = m_path_index.find (std::make_pair (p.m_direction, prefix));
            if (pi != m_path_index.end ())
            {
                r = pi->second;
                break;
            }
        }
    }

    m_ancestor_cache.emplace (i, r);
    return r;
}
//............................................................................

budget_post const &
post_hierarchy::post (std::string const & id) const
{
    return m_posts [index_of (id)];
}

budget_post const *
post_hierarchy::nearest_ancestor (std::string const & id) const
{
    int32_t const a = ancestor_of (index_of (id));

    return (a < 0 ? nullptr : & m_posts [a]);
}

std::vector<std::string>
post_hierarchy::descendants (std::string const & id) const
{
    budget_post const & p = post (id);

    std::vector<int32_t> ds { };

    if (p.m_direction != direction::transfer)
    {
        for (int32_t i = 0, i_limit = m_posts.size (); i < i_limit; ++ i)
        {
            budget_post const & d = m_posts [i];

            if ((d.m_direction == p.m_direction) && is_strict_prefix (p.m_category_path, d.m_category_path))
                ds.push_back (i);
        }

        std::stable_sort (ds.begin (), ds.end (), [this](int32_t const lhs, int32_t const rhs)
            {
                return (m_posts [lhs].m_category_path.size () < m_posts [rhs].m_category_path.size ());
            });
    }

    std::vector<std::string> r { };
    for (int32_t const i : ds)
        r.push_back (m_posts [i].m_id);

    return r;
}
//............................................................................

void
post_hierarchy::check_pool (int32_t const i) const
{
    budget_post const & p = m_posts [i];

    if (p.m_direction == direction::transfer)
        return;

    int32_t const a = ancestor_of (i);
    if ((a >= 0) && CF_UNLIKELY (! is_subset (p.m_container_ids, m_posts [a].m_container_ids)))
    {
        throw_x (invalid_input, "containers " + print (p.m_container_ids) + " of post " + print (p.m_id)
            + " are not a subset of those of its ancestor " + print (m_posts [a].m_id) + ": " + print (m_posts [a].m_container_ids));
    }

    for (amount_pattern const & pattern : p.m_patterns)
    {
        if (CF_UNLIKELY (! is_subset (pattern.m_container_ids, p.m_container_ids)))
        {
            throw_x (invalid_input, "pattern containers " + print (pattern.m_container_ids) + " are not a subset of those of post "
                + print (p.m_id) + ": " + print (p.m_container_ids));
        }
    }
}

void
post_hierarchy::validate () const
{
    for (int32_t i = 0, i_limit = m_posts.size (); i < i_limit; ++ i)
    {
        check_pool (i);
    }
}
//............................................................................

std::vector<post_hierarchy::change>
post_hierarchy::update_pool (std::string const & id, container_id_vector const & pool)
{
    int32_t const i = index_of (id);
    budget_post & p = m_posts [i];

    if (CF_UNLIKELY (p.m_direction == direction::transfer))
        throw_x (invalid_input, "transfer post " + print (id) + " has no container pool");
    if (CF_UNLIKELY (pool.empty ()))
        throw_x (invalid_input, "empty container pool for post " + print (id));

    int32_t const a = ancestor_of (i);
    if ((a >= 0) && CF_UNLIKELY (! is_subset (pool, m_posts [a].m_container_ids)))
    {
        throw_x (invalid_input, "containers " + print (pool) + " are not a subset of those of ancestor "
            + print (m_posts [a].m_id) + ": " + print (m_posts [a].m_container_ids));
    }

    p.m_container_ids = pool;
    narrow_patterns (p);

    std::vector<change> r { };

    for (std::string const & d_id : descendants (id))
    {
        int32_t const di = index_of (d_id);
        budget_post & d = m_posts [di];

        container_id_vector const & ancestor_pool = m_posts [ancestor_of (di)].m_container_ids;
        container_id_vector narrowed = narrow (d.m_container_ids, ancestor_pool);

        if (narrowed != d.m_container_ids)
        {
            r.push_back ({ d.m_id, d.m_container_ids, narrowed });
            d.m_container_ids = std::move (narrowed);
        }

        narrow_patterns (d);
    }

    LOG_trace1 << "post " << print (id) << " pool set to " << print (pool) << ", cascaded to " << r.size () << " descendant(s)";

    return r;
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
