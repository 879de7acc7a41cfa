
#include "cf/budget/amount_pattern_builder.h"

#include "cf/strings.h"

#include <set>

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
//............................................................................
//............................................................................
namespace
{

template<typename T>
T const &
require (optional<T> const & v, recurrence_type::enum_t const type, string_literal_t const field)
{
    if (CF_UNLIKELY (! v))
        throw_x (invalid_input, "'" + string_cast (type) + "' requires '" + field + '\'');

    return (* v);
}

void
check_range (int32_t const v, int32_t const lo, int32_t const hi, string_literal_t const field)
{
    if (CF_UNLIKELY ((v < lo) || (v > hi)))
        throw_x (invalid_input, "'" + std::string { field } + "' must be in [" + string_cast (lo) + ", " + string_cast (hi) + "]: " + string_cast (v));
}

} // end of anonymous
//............................................................................
//............................................................................

#define cf_BUILDER_SETTER(name, param_type, field) \
    amount_pattern_builder & \
    amount_pattern_builder::name (param_type v) \
    { \
        field = v; \
        return (* this); \
    } \
    /* */

cf_BUILDER_SETTER (amount,          amount_t const,                             m_amount)
cf_BUILDER_SETTER (start_date,      date_t const &,                             m_start_date)
cf_BUILDER_SETTER (end_date,        optional<date_t> const &,                   m_end_date)
cf_BUILDER_SETTER (container_ids,   container_id_vector const &,                m_container_ids)

cf_BUILDER_SETTER (type,            recurrence_type::enum_t const,              m_type)
cf_BUILDER_SETTER (interval,        int32_t const,                              m_interval)
cf_BUILDER_SETTER (weekday,         weekday_t const,                            m_weekday)
cf_BUILDER_SETTER (day_of_month,    int32_t const,                              m_day_of_month)
cf_BUILDER_SETTER (position,        relative_position::enum_t const,            m_position)
cf_BUILDER_SETTER (month,           int32_t const,                              m_month)
cf_BUILDER_SETTER (months,          std::vector<int32_t> const &,               m_months)
cf_BUILDER_SETTER (bank_day_number, int32_t const,                              m_bank_day_number)
cf_BUILDER_SETTER (from_end,        bool const,                                 m_from_end)

cf_BUILDER_SETTER (adjustment,      cal::bank_day_adjustment::enum_t const,     m_adjustment)
cf_BUILDER_SETTER (keep_in_month,   bool const,                                 m_keep_in_month)
cf_BUILDER_SETTER (no_dedup,        bool const,                                 m_no_dedup)

cf_BUILDER_SETTER (for_transfer,    bool const,                                 m_for_transfer)

#undef cf_BUILDER_SETTER
//............................................................................

amount_pattern
amount_pattern_builder::build () const
{
    if (CF_UNLIKELY (! m_amount))
        throw_x (invalid_input, "'amount' is required");
    if (CF_UNLIKELY (! m_start_date || m_start_date->is_special ()))
        throw_x (invalid_input, "'start_date' is required");
    if (CF_UNLIKELY (! m_type))
        throw_x (invalid_input, "recurrence 'type' is required");

    amount_pattern r { };

    r.m_amount = * m_amount;
    r.m_start_date = * m_start_date;
    r.m_recurrence = build_recurrence ();

    if (m_end_date)
    {
        if (CF_UNLIKELY (! is_repeating (r.m_recurrence)))
            throw_x (invalid_input, "'" + string_cast (* m_type) + "' pattern cannot have an end date");

        if (CF_UNLIKELY (* m_end_date < * m_start_date))
            throw_x (invalid_input, "end date " + print (* m_end_date) + " is before start date " + print (* m_start_date));

        r.m_end_date = m_end_date;
    }

    if (m_for_transfer)
    {
        if (CF_UNLIKELY (! m_container_ids.empty ()))
            throw_x (invalid_input, "a transfer pattern cannot have containers: " + print (m_container_ids));
    }
    else
    {
        if (CF_UNLIKELY (m_container_ids.empty ()))
            throw_x (invalid_input, "at least one container is required");

        if (CF_UNLIKELY (std::set<container_id> (m_container_ids.begin (), m_container_ids.end ()).size () != m_container_ids.size ()))
            throw_x (invalid_input, "duplicate containers: " + print (m_container_ids));

        r.m_container_ids = m_container_ids;
    }

    return r;
}
//............................................................................

adjustment_policy
amount_pattern_builder::build_adjustment () const
{
    adjustment_policy r { };

    r.m_direction = m_adjustment;
    r.m_keep_in_month = m_keep_in_month;
    r.m_no_dedup = m_no_dedup;

    return r;
}

recurrence_pattern
amount_pattern_builder::build_recurrence () const
{
    recurrence_type::enum_t const type = * m_type;

    int32_t const interval = (m_interval ? * m_interval : 1);
    if (CF_UNLIKELY (interval < 1))
        throw_x (invalid_input, "'interval' must be positive: " + string_cast (interval));

    switch (type)
    {
        case recurrence_type::monthly_bank_day:
        case recurrence_type::yearly_bank_day:
        case recurrence_type::period_once:
        case recurrence_type::period_monthly:
        case recurrence_type::period_yearly:
        {
            if (CF_UNLIKELY (m_adjustment != cal::bank_day_adjustment::none))
                throw_x (invalid_input, "'" + string_cast (type) + "' does not take a bank day adjustment");
        }
        break;

        default: break;

    } // end of switch

    switch (type)
    {
        case recurrence_type::once:
        {
            return once { build_adjustment () };
        }

        case recurrence_type::daily:
        {
            return daily { interval, build_adjustment () };
        }

        case recurrence_type::weekly:
        {
            return weekly { require (m_weekday, type, "weekday"), interval, build_adjustment () };
        }

        case recurrence_type::monthly_fixed:
        {
            int32_t const dom = require (m_day_of_month, type, "day_of_month");
            check_range (dom, 1, 31, "day_of_month");

            return monthly_fixed { dom, interval, build_adjustment () };
        }

        case recurrence_type::monthly_relative:
        {
            weekday_t const wd = require (m_weekday, type, "weekday");
            relative_position::enum_t const pos = require (m_position, type, "relative_position");

            return monthly_relative { wd, pos, interval, build_adjustment () };
        }

        case recurrence_type::monthly_bank_day:
        {
            int32_t const n = require (m_bank_day_number, type, "bank_day_number");
            check_range (n, 1, max_bank_day_number (), "bank_day_number");

            return monthly_bank_day { n, m_from_end, interval };
        }

        case recurrence_type::yearly:
        {
            int32_t const month = require (m_month, type, "month");
            check_range (month, 1, 12, "month");

            bool const has_fixed = static_cast<bool> (m_day_of_month);
            bool const has_relative = static_cast<bool> (m_position);

            if (CF_UNLIKELY (has_fixed == has_relative))
                throw_x (invalid_input, "'yearly' requires either 'day_of_month' or ('relative_position' + 'weekday'), but not both");

            yearly r { };
            r.m_month = month;
            r.m_interval = interval;
            r.m_adjustment = build_adjustment ();

            if (has_fixed)
            {
                check_range (* m_day_of_month, 1, 31, "day_of_month");
                r.m_anchor = fixed_day { * m_day_of_month };
            }
            else
            {
                r.m_anchor = relative_day { * m_position, require (m_weekday, type, "weekday") };
            }

            return r;
        }

        case recurrence_type::yearly_bank_day:
        {
            int32_t const month = require (m_month, type, "month");
            check_range (month, 1, 12, "month");

            int32_t const n = require (m_bank_day_number, type, "bank_day_number");
            check_range (n, 1, max_bank_day_number (), "bank_day_number");

            return yearly_bank_day { month, n, m_from_end, interval };
        }

        case recurrence_type::period_once:
        {
            return period_once { };
        }

        case recurrence_type::period_monthly:
        {
            return period_monthly { interval };
        }

        case recurrence_type::period_yearly:
        {
            std::vector<int32_t> const & months = require (m_months, type, "months");

            if (CF_UNLIKELY (months.empty ()))
                throw_x (invalid_input, "'period_yearly' requires a non-empty 'months' list");

            for (int32_t const m : months)
                check_range (m, 1, 12, "months");

            if (CF_UNLIKELY (sorted_unique (months).size () != months.size ()))
                throw_x (invalid_input, "'months' must be unique: " + print (months));

            return period_yearly { months, interval };
        }

        default: break;

    } // end of switch

    throw_x (invalid_input, "invalid recurrence type " + string_cast (type));
}

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
