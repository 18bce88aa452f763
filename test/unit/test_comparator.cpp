#include "xlsxextract/match/Comparator.hpp"
#include "xlsxextract/core/Exception.hpp"
#include <gtest/gtest.h>

using namespace xlsxextract;
using core::Value;
using match::Comparator;
using Op = match::Comparator::Operator;

class ComparatorTest : public ::testing::Test {
protected:
    static bool matches(Op op, const Value& operand, const Value& candidate) {
        return Comparator(op, operand).match(candidate).has_value();
    }
};

// 测试相等与不等
TEST_F(ComparatorTest, EqualityOnText) {
    EXPECT_TRUE(matches(Op::Equal, Value("foo"), Value("foo")));
    EXPECT_FALSE(matches(Op::Equal, Value("foo"), Value("Foo")));
    EXPECT_TRUE(matches(Op::NotEqual, Value("foo"), Value("bar")));
    EXPECT_FALSE(matches(Op::NotEqual, Value("foo"), Value("foo")));

    auto captured = Comparator(Op::Equal, Value("foo")).match(Value("foo"));
    ASSERT_TRUE(captured);
    EXPECT_EQ(*captured, Value("foo"));
}

TEST_F(ComparatorTest, NumbersAreOrdered) {
    EXPECT_TRUE(matches(Op::Equal, Value(3), Value(3.0)));
    EXPECT_TRUE(matches(Op::Greater, Value(2), Value(3)));
    EXPECT_FALSE(matches(Op::Greater, Value(3), Value(3)));
    EXPECT_TRUE(matches(Op::GreaterEqual, Value(3), Value(3)));
    EXPECT_TRUE(matches(Op::Less, Value(3), Value(2.5)));
    EXPECT_TRUE(matches(Op::LessEqual, Value(2.5), Value(2.5)));
    EXPECT_FALSE(matches(Op::LessEqual, Value(2.5), Value(2.6)));
}

// 类型不兼容视为不匹配
TEST_F(ComparatorTest, TypeMismatchNeverMatches) {
    EXPECT_FALSE(matches(Op::Equal, Value(1), Value("1")));
    EXPECT_FALSE(matches(Op::Greater, Value("a"), Value(5)));
    EXPECT_FALSE(matches(Op::Equal, Value(1), Value(true)));
    EXPECT_FALSE(matches(Op::NotEqual, Value(1), Value("x")));
    EXPECT_FALSE(match::compareValues(Value(1), Value("1")).has_value());
}

TEST_F(ComparatorTest, BooleansAreOrdered) {
    EXPECT_TRUE(matches(Op::GreaterEqual, Value(false), Value(true)));
    EXPECT_TRUE(matches(Op::Equal, Value(true), Value(true)));
    EXPECT_FALSE(matches(Op::Greater, Value(true), Value(false)));
}

// Date 与 DateTime 可以互相比较
TEST_F(ComparatorTest, DateWidensToDateTime) {
    const Value date(core::Date(2021, 5, 1));
    const Value midnight(core::DateTime(2021, 5, 1));
    const Value noon(core::DateTime(2021, 5, 1, 12, 0));

    EXPECT_TRUE(matches(Op::Equal, date, midnight));
    EXPECT_TRUE(matches(Op::Equal, midnight, date));
    EXPECT_TRUE(matches(Op::Greater, date, noon));
    EXPECT_TRUE(matches(Op::Less, noon, date));
    EXPECT_FALSE(matches(Op::Equal, Value(core::Time(0, 0)), date));
}

TEST_F(ComparatorTest, NullCandidate) {
    EXPECT_TRUE(matches(Op::Equal, Value(), Value()));
    EXPECT_FALSE(matches(Op::Equal, Value(""), Value()));
    EXPECT_FALSE(matches(Op::Greater, Value(1), Value()));
    EXPECT_FALSE(matches(Op::LessEqual, Value(1), Value()));
}

// 测试 Empty / NotEmpty 的捕获值
TEST_F(ComparatorTest, EmptyAndNotEmpty) {
    Comparator empty(Op::Empty);
    auto blank = empty.match(Value());
    ASSERT_TRUE(blank);
    EXPECT_EQ(*blank, Value(""));
    EXPECT_TRUE(empty.match(Value("")));
    EXPECT_FALSE(empty.match(Value(" x ")));
    EXPECT_FALSE(empty.match(Value(0)));

    Comparator not_empty(Op::NotEmpty);
    auto captured = not_empty.match(Value(42));
    ASSERT_TRUE(captured);
    EXPECT_EQ(*captured, Value(42));
    EXPECT_FALSE(not_empty.match(Value()));
    EXPECT_FALSE(not_empty.match(Value("")));
}

TEST_F(ComparatorTest, RegexCapturesFirstGroup) {
    Comparator with_group(Op::Regex, Value("^Da(.+)"));
    auto captured = with_group.match(Value("Date"));
    ASSERT_TRUE(captured);
    EXPECT_EQ(*captured, Value("te"));

    Comparator without_group(Op::Regex, Value("^da"));
    auto whole = without_group.match(Value("Date"));
    ASSERT_TRUE(whole);
    EXPECT_EQ(*whole, Value("Date"));

    EXPECT_FALSE(with_group.match(Value("Update")));
    EXPECT_FALSE(with_group.match(Value(1)));
}

TEST_F(ComparatorTest, RegexSearchesAnywhere) {
    Comparator comp(Op::Regex, Value("report (\\d+)"));
    auto captured = comp.match(Value("Monthly REPORT 12.xlsx"));
    ASSERT_TRUE(captured);
    EXPECT_EQ(captured->asText(), "12");
}

TEST_F(ComparatorTest, InvalidRegexThrows) {
    EXPECT_THROW(Comparator(Op::Regex, Value("(unclosed")), core::InvalidComparator);
    EXPECT_THROW(Comparator(Op::Regex, Value(3)), core::InvalidComparator);
}

TEST_F(ComparatorTest, ToString) {
    EXPECT_EQ(Comparator(Op::Equal, Value("foo")).toString(), "is foo");
    EXPECT_EQ(Comparator(Op::GreaterEqual, Value(6)).toString(), ">= 6");
    EXPECT_EQ(Comparator(Op::Empty).toString(), "is empty");
}
