#pragma once

#include "cf/util/datetime.h"

#include <memory>
#include <vector>

//----------------------------------------------------------------------------
namespace cf
{
namespace cal
{
using util::date_t;

/**
 * algorithmic bank holiday rules for one country
 */
class holiday_rules
{
    public: // ...............................................................

        virtual ~holiday_rules ()     = default;

        /**
         * @return ISO 3166 country code
         */
        virtual std::string const & country () const = 0;

        /**
         * @return bank holidays in 'year', in ascending order
         */
        virtual std::vector<date_t> holidays (int32_t const year) const = 0;

}; // end of class
//............................................................................
/**
 * Easter Sunday in 'year' (Anonymous Gregorian algorithm)
 */
extern date_t
easter_sunday (int32_t const year);

/**
 * @param country ISO 3166 country code (currently "DK" only)
 *
 * @throws invalid_input for an unknown 'country'
 */
extern std::unique_ptr<holiday_rules>
make_holiday_rules (std::string const & country);

} // end of 'cal'
} // end of namespace
//----------------------------------------------------------------------------
