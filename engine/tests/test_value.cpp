#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "querylab/value.h"

using namespace querylab;

TEST(ValueTest, NullNeverCompares) {
    EXPECT_FALSE(compare_values(Value::null(), Value::integer(1)).has_value());
    EXPECT_FALSE(compare_values(Value::integer(1), Value::null()).has_value());
    EXPECT_FALSE(compare_values(Value::null(), Value::null()).has_value());
}

TEST(ValueTest, NumericKindsCompareAcrossIntegerAndFloat) {
    auto c = compare_values(Value::integer(2), Value::real(2.0));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, 0);
    EXPECT_EQ(*compare_values(Value::integer(1), Value::real(1.5)), -1);
}

TEST(ValueTest, TextAgainstNumberIsIncomparable) {
    EXPECT_FALSE(comparable(Value::text("abc"), Value::integer(3)));
}

TEST(ValueTest, DateComparesWithIsoText) {
    Value d = Value::date(2021, 6, 1);
    EXPECT_EQ(*compare_values(d, Value::text("2021-01-01")), 1);
    EXPECT_EQ(*compare_values(Value::text("2021-06-01"), d), 0);
    EXPECT_FALSE(compare_values(d, Value::text("not a date")).has_value());
}

TEST(ValueTest, ParseDateAcceptsOptionalTime) {
    auto d = parse_date("2023-02-14 16:30");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year, 2023);
    EXPECT_EQ(d->hour, 16);
    EXPECT_TRUE(d->has_time);
    EXPECT_FALSE(parse_date("2023-13-01").has_value());
    EXPECT_EQ(format_date(*parse_date("2020-03-15")), "2020-03-15");
}

TEST(ValueTest, OrderPutsNullFirst) {
    EXPECT_LT(order_values(Value::null(), Value::integer(-100)), 0);
    EXPECT_GT(order_values(Value::text("b"), Value::text("a")), 0);
    EXPECT_EQ(order_values(Value::null(), Value::null()), 0);
}

TEST(ValueTest, ArithmeticPropagatesNullAndDivisionByZero) {
    EXPECT_TRUE(arithmetic(Value::integer(1), '+', Value::null()).is_null());
    EXPECT_TRUE(arithmetic(Value::integer(1), '/', Value::integer(0)).is_null());
    EXPECT_EQ(arithmetic(Value::integer(7), '+', Value::integer(3)).as_int(), 10);
    EXPECT_EQ(arithmetic(Value::integer(7), '-', Value::real(0.5)).kind(), ValueKind::Float);
}

TEST(ValueTest, IntegerOverflowPromotesToFloat) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    Value sum = arithmetic(Value::integer(max), '+', Value::integer(1));
    EXPECT_EQ(sum.kind(), ValueKind::Float);
    EXPECT_DOUBLE_EQ(sum.as_double(), double(max) + 1.0);
    EXPECT_EQ(arithmetic(Value::integer(min), '-', Value::integer(1)).kind(), ValueKind::Float);
    EXPECT_EQ(arithmetic(Value::integer(max), '*', Value::integer(2)).kind(), ValueKind::Float);
    EXPECT_EQ(arithmetic(Value::integer(0), '-', Value::integer(min)).kind(), ValueKind::Float);

    Value rem = arithmetic(Value::integer(min), '%', Value::integer(-1));
    EXPECT_EQ(rem.kind(), ValueKind::Integer);
    EXPECT_EQ(rem.as_int(), 0);
    EXPECT_EQ(arithmetic(Value::integer(max - 1), '+', Value::integer(1)).as_int(), max);
}

TEST(ValueTest, GroupKeyTreatsEqualNumbersAlike) {
    EXPECT_EQ(group_key(Value::integer(1)), group_key(Value::real(1.0)));
    EXPECT_NE(group_key(Value::text("1")), group_key(Value::integer(1)));
    EXPECT_TRUE(same_value(Value::null(), Value::null()));
}

TEST(ValueTest, LiteralQuotesText) {
    EXPECT_EQ(Value::text("O'Brien").to_literal(), "'O''Brien'");
    EXPECT_EQ(Value::integer(5).to_literal(), "5");
    EXPECT_EQ(Value::null().to_string(), "NULL");
}

TEST(RowTest, LookupIsCaseInsensitive) {
    Row row{{"Id", Value::integer(1)}, {"name", Value::text("x")}};
    EXPECT_TRUE(row.has("id"));
    EXPECT_EQ(row.get("NAME").as_text(), "x");
    EXPECT_TRUE(row.get("missing").is_null());
    row.set("id", Value::integer(2));
    EXPECT_EQ(row.get("id").as_int(), 2);
    EXPECT_EQ(row.size(), 2u);
}
