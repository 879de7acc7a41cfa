#pragma once

#include "cf/budget/budget_post.h"

#include <map>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * the posts of one budget arranged into per-direction trees keyed by category path
 *
 * a post's container pool must be a subset of the pool of its nearest existing
 * ancestor (levels may be skipped; root posts are unconstrained) and each pattern's
 * containers must be a subset of its post's pool. Transfer posts take no part in
 * these constraints.
 */
class post_hierarchy final
{
    public: // ...............................................................

        /**
         * one descendant whose container pool was changed by a cascade
         */
        struct change final
        {
            std::string m_post_id;
            container_id_vector m_old;
            container_id_vector m_new;

            friend std::ostream & operator<< (std::ostream & os, change const & obj);

        }; // end of nested class

        /**
         * @throws invalid_input on duplicate post ids or duplicate (direction, category path) keys
         */
        post_hierarchy (budget_post_vector posts);

        // ACCESSORs:

        budget_post_vector const & posts () const
        {
            return m_posts;
        }

        budget_post const & post (std::string const & id) const;

        /**
         * @return nearest existing ancestor of post 'id' (null for a root post)
         */
        budget_post const * nearest_ancestor (std::string const & id) const;

        /**
         * @return ids of all (transitive) descendants of post 'id', shallower first
         */
        std::vector<std::string> descendants (std::string const & id) const;

        /**
         * @throws invalid_input if any post violates the pool constraints
         */
        void validate () const;

        // MUTATORs:

        /**
         * sets the pool of post 'id' to 'pool' (which must itself satisfy the constraint
         * against its ancestor) and cascades top-down: each descendant pool becomes its
         * intersection with the new pool of its nearest ancestor, or that whole ancestor
         * pool if the intersection is empty; pattern container lists are cleaned the same
         * way against their post's new pool
         *
         * @return descendants whose pool changed, in cascade order
         */
        std::vector<change> update_pool (std::string const & id, container_id_vector const & pool);

    private: // ..............................................................

        int32_t index_of (std::string const & id) const;
        int32_t ancestor_of (int32_t const i) const; // memoized, -1 for a root

        void check_pool (int32_t const i) const;

        budget_post_vector m_posts;
        std::map<std::string, int32_t> m_id_index { };
        std::map<std::pair<direction::enum_t, string_vector>, int32_t> m_path_index { };
        mutable std::map<int32_t, int32_t> m_ancestor_cache { };

}; // end of class

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
