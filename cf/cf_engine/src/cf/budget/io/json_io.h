#pragma once

#include "cf/budget/forecast_projector.h"
#include "cf/util/json_fwd.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
namespace io
{
/**
 * JSON wire shapes of patterns, posts and preview/forecast results
 *
 * all decoding failures (missing or mistyped fields, unknown enum names, invalid
 * dates, builder validation) are reported as 'invalid_input' or a derivative
 */
//............................................................................
// decoding:

/**
 * @code
 *  {
 *      "amount": 120000, "start_date": "2024-01-01", "end_date": null,
 *      "recurrence_pattern": { "type": "monthly_fixed", "day_of_month": 31, "interval": 1,
 *                              "bank_day_adjustment": "previous", "bank_day_keep_in_month": true },
 *      "container_ids": [ "checking" ]
 *  }
 * @endcode
 *
 * @param for_transfer [patterns of transfer posts carry no containers]
 */
extern amount_pattern
parse_pattern (json const & j, bool const for_transfer = false);

extern amount_pattern_vector
parse_patterns (json const & j, bool const for_transfer = false);

/**
 * @code
 *  {
 *      "id": "p1", "name": "Rent", "category_path": [ "Housing", "Rent" ], "direction": "expense",
 *      "accumulate": false, "container_ids": [ "checking" ],
 *      "transfer_from": null, "transfer_to": null,
 *      "patterns": [ ... ], "carry_forward": { "2024-05": 1500 }
 *  }
 * @endcode
 */
extern budget_post
parse_post (json const & j);

extern budget_post_vector
parse_posts (json const & j);

/**
 * @param j [object of container id -> amount]
 */
extern container_balances
parse_balances (json const & j);

//............................................................................
// encoding:

/**
 * @return '{ "pattern_index", "date", "amount" }' array
 */
extern json
occurrences_to_json (occurrence_vector const & occurrences);

extern json
dates_to_json (std::vector<date_t> const & dates);

/**
 * @return '{ "occurrences": [...], "non_bank_days": [...] }'
 */
extern json
preview_to_json (occurrence_vector const & occurrences, std::vector<date_t> const & non_bank_days);

/**
 * expenses (monthly totals and the large expense amount) are reported negated
 *
 * @return '{ "projections": [...], "lowest_point": { "month", "balance" }, "next_large_expense": { "name", "amount", "date" } | null }'
 */
extern json
forecast_to_json (forecast_result const & r);

} // end of 'io'
} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
