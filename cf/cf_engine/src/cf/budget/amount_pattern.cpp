
#include "cf/budget/amount_pattern.h"

#include "cf/strings.h"

#include <ostream>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{

std::ostream &
operator<< (std::ostream & os, amount_pattern const & obj)
{
    os << "{amount: " << obj.m_amount << ", start: " << print (obj.m_start_date) << ", end: ";
    {
        if (obj.m_end_date)
            os << print (* obj.m_end_date);
        else
            os << "none";
    }

    return os << ", " << obj.m_recurrence << ", containers: " << print (obj.m_container_ids) << '}';
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
