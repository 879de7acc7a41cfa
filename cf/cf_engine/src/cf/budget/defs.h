#pragma once

#include "cf/enums.h"
#include "cf/exceptions.h"
#include "cf/util/datetime.h"

#include <string>
#include <vector>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
using util::date_t;
using util::month_index_t;

/**
 * money in minor currency units (no floating point anywhere in this namespace)
 */
using amount_t              = int64_t;

using container_id          = std::string;
using container_id_vector   = std::vector<container_id>;

//............................................................................

CF_ENUM (direction,
    (
        income,
        expense,
        transfer
    ),
    iterable, printable, parsable

); // end of enum

CF_ENUM (relative_position,
    (
        first,
        second,
        third,
        fourth,
        last
    ),
    iterable, printable, parsable

); // end of enum

CF_ENUM (occurrence_kind,
    (
        dated,
        period
    ),
    printable, parsable

); // end of enum
//............................................................................
/**
 * a recurrence variant with impossible field values reached the generator
 */
CF_DEFINE_EXCEPTION (malformed_pattern, illegal_state);

//............................................................................

/**
 * how far outside of a query window a candidate date may fall and still be
 * bank-day adjusted into it
 */
constexpr int32_t adjustment_margin_days ()     { return 31; }

constexpr int32_t max_bank_day_number ()        { return 10; }

/**
 * the number of leading forecast months scanned for a "large" expense
 */
constexpr int32_t large_expense_horizon ()      { return 3; }

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
