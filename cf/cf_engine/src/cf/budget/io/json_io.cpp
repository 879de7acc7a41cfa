
#include "cf/budget/io/json_io.h"

#include "cf/budget/amount_pattern_builder.h"
#include "cf/settings.h"
#include "cf/util/json.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace budget
{
namespace io
{
//............................................................................
//............................................................................
namespace
{

void
check_object (json const & j, string_literal_t const what)
{
    if (CF_UNLIKELY (! j.is_object ()))
        throw_x (invalid_input, std::string { what } + " must be an object, not " + print (j.type ()));
}

void
check_array (json const & j, string_literal_t const what)
{
    if (CF_UNLIKELY (! j.is_array ()))
        throw_x (invalid_input, std::string { what } + " must be an array, not " + print (j.type ()));
}

template<typename T>
T
required (json const & j, std::string const & key)
{
    auto const i = j.find (key);
    if (CF_UNLIKELY ((i == j.end ()) || i->is_null ()))
        throw_x (invalid_input, "missing required field " + print (key));

    return get_or<T> (j, key, T { });
}

template<typename T>
optional<T>
optional_field (json const & j, std::string const & key)
{
    auto const i = j.find (key);
    if ((i == j.end ()) || i->is_null ())
        return { };

    return get_or<T> (j, key, T { });
}

} // end of anonymous
//............................................................................
//............................................................................

amount_pattern
parse_pattern (json const & j, bool const for_transfer)
{
    check_object (j, "amount pattern");

    amount_pattern_builder b { };

    b.amount (required<amount_t> (j, "amount"))
     .start_date (util::parse_date (required<std::string> (j, "start_date")))
     .container_ids (get_or<container_id_vector> (j, "container_ids", { }))
     .for_transfer (for_transfer);

    if (auto const end = optional_field<std::string> (j, "end_date"))
        b.end_date (util::parse_date (* end));

    auto const i = j.find ("recurrence_pattern");
    if (CF_UNLIKELY (i == j.end ()))
        throw_x (invalid_input, "missing required field \"recurrence_pattern\"");

    json const & rp = * i;
    check_object (rp, "recurrence pattern");

    b.type (recurrence_type::value (required<std::string> (rp, "type")));

    if (auto const v = optional_field<int32_t> (rp, "interval"))            b.interval (* v);
    if (auto const v = optional_field<int32_t> (rp, "weekday"))             b.weekday (weekday_from_index (* v));
    if (auto const v = optional_field<int32_t> (rp, "day_of_month"))        b.day_of_month (* v);
    if (auto const v = optional_field<std::string> (rp, "relative_position"))   b.position (relative_position::value (* v));
    if (auto const v = optional_field<int32_t> (rp, "month"))               b.month (* v);
    if (auto const v = optional_field<std::vector<int32_t>> (rp, "months")) b.months (* v);
    if (auto const v = optional_field<int32_t> (rp, "bank_day_number"))     b.bank_day_number (* v);

    b.from_end (get_or<bool> (rp, "bank_day_from_end", false))
     .adjustment (cal::bank_day_adjustment::value (get_or<std::string> (rp, "bank_day_adjustment", "none")))
     .keep_in_month (get_or<bool> (rp, "bank_day_keep_in_month", true))
     .no_dedup (get_or<bool> (rp, "bank_day_no_dedup", false));

    return b.build ();
}

amount_pattern_vector
parse_patterns (json const & j, bool const for_transfer)
{
    check_array (j, "pattern list");

    amount_pattern_vector r { };

    for (std::size_t i = 0; i < j.size (); ++ i)
    {
        try
        {
            r.push_back (parse_pattern (j [i], for_transfer));
        }
        catch (invalid_input const & e)
        {
            chain_x (invalid_input, "invalid pattern #" + string_cast (i));
        }
    }

    return r;
}
//............................................................................

budget_post
parse_post (json const & j)
{
    check_object (j, "budget post");

    budget_post r { };

    r.m_id = required<std::string> (j, "id");
    r.m_name = get_or<std::string> (j, "name", "");
    r.m_category_path = get_or<string_vector> (j, "category_path", { });
    r.m_direction = direction::value (required<std::string> (j, "direction"));
    r.m_accumulate = get_or<bool> (j, "accumulate", false);

    if (CF_UNLIKELY (r.m_accumulate && (r.m_direction != direction::expense)))
        throw_x (invalid_input, "post " + print (r.m_id) + ": only expense posts can accumulate");

    bool const transfer = (r.m_direction == direction::transfer);

    if (transfer)
    {
        r.m_transfer_from = required<std::string> (j, "transfer_from");
        r.m_transfer_to = required<std::string> (j, "transfer_to");

        if (CF_UNLIKELY (r.m_transfer_from == r.m_transfer_to))
            throw_x (invalid_input, "post " + print (r.m_id) + ": transfer from and to the same container " + print (r.m_transfer_from));
    }
    else
    {
        r.m_container_ids = get_or<container_id_vector> (j, "container_ids", { });
    }

    auto const i = j.find ("patterns");
    if (i != j.end ())
    {
        try
        {
            r.m_patterns = parse_patterns (* i, transfer);
        }
        catch (invalid_input const & e)
        {
            chain_x (invalid_input, "post " + print (r.m_id));
        }
    }

    auto const carry = j.find ("carry_forward");
    if ((carry != j.end ()) && ! carry->is_null ())
    {
        check_object (* carry, "carry forward");

        for (auto m = carry->begin (); m != carry->end (); ++ m)
        {
            r.m_carry_forward [util::parse_month (m.key ())] = get_or<amount_t> (* carry, m.key (), 0);
        }
    }

    return r;
}

budget_post_vector
parse_posts (json const & j)
{
    check_array (j, "post list");

    budget_post_vector r { };
    for (json const & p : j)
        r.push_back (parse_post (p));

    return r;
}

container_balances
parse_balances (json const & j)
{
    container_balances r { };

    if (j.is_null ())
        return r;

    check_object (j, "container balances");

    for (auto i = j.begin (); i != j.end (); ++ i)
    {
        r [i.key ()] = get_or<amount_t> (j, i.key (), 0);
    }

    return r;
}
//............................................................................

json
occurrences_to_json (occurrence_vector const & occurrences)
{
    json r = json::array ();

    for (occurrence const & o : occurrences)
    {
        r.push_back ({ { "pattern_index", o.m_pattern_index }, { "date", util::print_date (o.m_date) }, { "amount", o.m_amount } });
    }

    return r;
}

json
dates_to_json (std::vector<date_t> const & dates)
{
    json r = json::array ();

    for (date_t const & d : dates)
        r.push_back (util::print_date (d));

    return r;
}

json
preview_to_json (occurrence_vector const & occurrences, std::vector<date_t> const & non_bank_days)
{
    return
    {
        { "occurrences", occurrences_to_json (occurrences) },
        { "non_bank_days", dates_to_json (non_bank_days) }
    };
}

json
forecast_to_json (forecast_result const & r)
{
    json projections = json::array ();

    for (month_projection const & mp : r.m_projections)
    {
        json containers = json::object ();
        for (auto const & kv : mp.m_container_balances)
            containers [kv.first] = kv.second;

        projections.push_back (
        {
            { "month", util::print_month (mp.m_month) },
            { "start_balance", mp.m_start_balance },
            { "expected_income", mp.m_expected_income },
            { "expected_expenses", - mp.m_expected_expenses },
            { "end_balance", mp.m_end_balance },
            { "container_balances", containers }
        });
    }

    json expense = nullptr;
    if (r.m_next_large_expense)
    {
        expense =
        {
            { "name", r.m_next_large_expense->m_name },
            { "amount", - r.m_next_large_expense->m_amount },
            { "date", util::print_date (r.m_next_large_expense->m_date) }
        };
    }

    return
    {
        { "projections", projections },
        { "lowest_point", { { "month", util::print_month (r.m_lowest_month) }, { "balance", r.m_lowest_balance } } },
        { "next_large_expense", expense }
    };
}

} // end of 'io'
} // end of 'budget'
} // end of namespace
//----------------------------------------------------------------------------
