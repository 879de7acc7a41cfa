
#include "cf/util/datetime.h"

#include "cf/util/logging.h"

#include "cf/test/utility.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace util
{
//............................................................................

TEST (parse_date, delimited_and_undelimited)
{
    EXPECT_EQ (parse_date ("2024-01-31"), date_t (2024, 1, 31));
    EXPECT_EQ (parse_date ("20240229"), date_t (2024, 2, 29));

    EXPECT_THROW (parse_date ("2023-02-29"), parse_failure);
    EXPECT_THROW (parse_date ("not a date"), parse_failure);
    EXPECT_THROW (parse_date (""), invalid_input);
}

TEST (parse_month, sniff)
{
    month_index_t const mi = parse_month ("2024-03");

    EXPECT_EQ (month_year (mi), 2024);
    EXPECT_EQ (month_of (mi), 3);
    EXPECT_EQ (print_month (mi), "2024-03");

    EXPECT_THROW (parse_month ("2024-13"), parse_failure);
    EXPECT_THROW (parse_month ("2024"), parse_failure);
}

TEST (month_index, arithmetic)
{
    month_index_t const dec = month_index (date_t (2023, 12, 15));
    month_index_t const jan = dec + 1;

    EXPECT_EQ (month_start (jan), date_t (2024, 1, 1));
    EXPECT_EQ (month_end (jan + 1), date_t (2024, 2, 29)); // leap year
    EXPECT_EQ (month_index (2024, 1), jan);

    EXPECT_EQ (days_in_month (2023, 2), 28);
    EXPECT_EQ (days_in_month (2024, 4), 30);
}

TEST (format_date, sniff)
{
    date_t const d { 2024, 6, 28 };

    EXPECT_EQ (format_date (d, "%Y/%m/%d"), "2024/06/28");
    EXPECT_EQ (print (d), "2024-06-28");
}

TEST (parse_ptime, sniff)
{
    ptime_t const t = parse_ptime ("2024-06-15 10:30:00");

    EXPECT_EQ (t.date (), date_t (2024, 6, 15));
    EXPECT_EQ (t.time_of_day ().hours (), 10);

    EXPECT_THROW (parse_ptime ("yesterday"), parse_failure);
}

} // end of 'util'
} // end of namespace
//----------------------------------------------------------------------------
