#pragma once

#include "cf/budget/amount_pattern.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
/**
 * collects draft pattern fields (in any order, possibly including fields the
 * chosen recurrence type doesn't use) and emits a validated @ref amount_pattern
 *
 * @code
 *  amount_pattern const p = amount_pattern_builder { }
 *      .amount (120000)
 *      .start_date ({ 2024, 1, 1 })
 *      .type (recurrence_type::monthly_fixed)
 *      .day_of_month (31)
 *      .container_ids ({ "checking" })
 *      .build ();
 * @endcode
 */
class amount_pattern_builder final
{
    public: // ...............................................................

        amount_pattern_builder & amount (amount_t const v);
        amount_pattern_builder & start_date (date_t const & v);
        amount_pattern_builder & end_date (optional<date_t> const & v);
        amount_pattern_builder & container_ids (container_id_vector const & v);

        amount_pattern_builder & type (recurrence_type::enum_t const v);
        amount_pattern_builder & interval (int32_t const v);
        amount_pattern_builder & weekday (weekday_t const v);
        amount_pattern_builder & day_of_month (int32_t const v);
        amount_pattern_builder & position (relative_position::enum_t const v);
        amount_pattern_builder & month (int32_t const v);
        amount_pattern_builder & months (std::vector<int32_t> const & v);
        amount_pattern_builder & bank_day_number (int32_t const v);
        amount_pattern_builder & from_end (bool const v);

        amount_pattern_builder & adjustment (cal::bank_day_adjustment::enum_t const v);
        amount_pattern_builder & keep_in_month (bool const v);
        amount_pattern_builder & no_dedup (bool const v);

        /**
         * a pattern of a transfer post carries no containers of its own
         */
        amount_pattern_builder & for_transfer (bool const v);

        /**
         * @throws invalid_input naming the first violation
         */
        amount_pattern build () const;

    private: // ..............................................................

        recurrence_pattern build_recurrence () const;
        adjustment_policy build_adjustment () const;

        optional<amount_t> m_amount { };
        optional<date_t> m_start_date { };
        optional<date_t> m_end_date { };
        container_id_vector m_container_ids { };

        optional<recurrence_type::enum_t> m_type { };
        optional<int32_t> m_interval { };
        optional<weekday_t> m_weekday { };
        optional<int32_t> m_day_of_month { };
        optional<relative_position::enum_t> m_position { };
        optional<int32_t> m_month { };
        optional<std::vector<int32_t>> m_months { };
        optional<int32_t> m_bank_day_number { };
        bool m_from_end { false };

        cal::bank_day_adjustment::enum_t m_adjustment { cal::bank_day_adjustment::none };
        bool m_keep_in_month { true };
        bool m_no_dedup { false };

        bool m_for_transfer { false };

}; // end of class

} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
