
#include "cf/budget/budget_post.h"

#include "cf/strings.h"

#include <ostream>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{

std::string const &
budget_post::display_name () const
{
    if (m_name.empty () && ! m_category_path.empty ())
        return m_category_path.back ();

    return m_name;
}

amount_t
budget_post::carry_forward (month_index_t const month) const
{
    if (! m_accumulate || (m_direction != direction::expense))
        return 0;

    auto const i = m_carry_forward.find (month);
    return (i == m_carry_forward.end () ? 0 : i->second);
}
//............................................................................

std::ostream &
operator<< (std::ostream & os, budget_post const & obj)
{
    os << '{' << print (obj.m_id) << ", " << print (obj.display_name ()) << ", " << obj.m_direction;

    if (obj.m_direction == direction::transfer)
        os << ", " << print (obj.m_transfer_from) << " -> " << print (obj.m_transfer_to);
    else
        os << ", containers: " << print (obj.m_container_ids);

    if (obj.m_accumulate) os << ", accumulate";

    return os << ", patterns: " << obj.m_patterns.size () << '}';
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
