#include <trialflow/core/error.hpp>
#include <trialflow/core/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace trialflow::core;

class ValueTest : public ::testing::Test {};

TEST_F(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_STREQ(v.kind_name(), "null");
    EXPECT_EQ(v.to_string(), "");
}

TEST_F(ValueTest, IntegerKinds) {
    Value a = 42;
    Value b = 42L;
    Value c = std::size_t{42};

    EXPECT_TRUE(a.is_int());
    EXPECT_EQ(a.as_int(), 42);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
}

TEST_F(ValueTest, LargeUnsignedKeepsSign) {
    const auto max_signed = static_cast<unsigned long long>(std::numeric_limits<int64_t>::max());

    Value fits = max_signed;
    EXPECT_TRUE(fits.is_int());
    EXPECT_EQ(fits.as_int(), std::numeric_limits<int64_t>::max());

    Value huge = std::numeric_limits<unsigned long long>::max();
    EXPECT_TRUE(huge.is_double());
    EXPECT_GT(huge.as_double(), 0.0);
    EXPECT_DOUBLE_EQ(huge.as_double(), 18446744073709551615.0);
}

TEST_F(ValueTest, AsDoubleAcceptsIntegers) {
    Value v = 3;
    EXPECT_DOUBLE_EQ(v.as_double(), 3.0);
    EXPECT_TRUE(v.is_number());
}

TEST_F(ValueTest, KindMismatchThrows) {
    Value v = "text";
    EXPECT_THROW((void)v.as_int(), ValueTypeError);
    EXPECT_THROW((void)v.as_bool(), ValueTypeError);
    EXPECT_THROW((void)v.as_object(), ValueTypeError);
    EXPECT_EQ(v.as_string(), "text");
}

TEST_F(ValueTest, ValueTypeErrorIsExperimentError) {
    Value v = 1.5;
    EXPECT_THROW((void)v.as_string(), ExperimentError);
}

// =============================================================================
// to_string
// =============================================================================

TEST_F(ValueTest, ScalarsToString) {
    EXPECT_EQ(Value(true).to_string(), "true");
    EXPECT_EQ(Value(false).to_string(), "false");
    EXPECT_EQ(Value(-7).to_string(), "-7");
    EXPECT_EQ(Value(0.25).to_string(), "0.25");
    EXPECT_EQ(Value(std::string("a b")).to_string(), "a b");
}

TEST_F(ValueTest, ArrayToString) {
    Value v = Array{1, 2.5, "x"};
    EXPECT_EQ(v.to_string(), "[1;2.5;x]");
}

TEST_F(ValueTest, ObjectToStringIsKeyOrdered) {
    Value v = Object{{"b", 2}, {"a", 1}};
    EXPECT_EQ(v.to_string(), "{a:1;b:2}");
}

TEST_F(ValueTest, NestedValuesCompareEqual) {
    Value a = Object{{"list", Array{1, 2}}, {"name", "x"}};
    Value b = Object{{"list", Array{1, 2}}, {"name", "x"}};
    Value c = Object{{"list", Array{1, 3}}, {"name", "x"}};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}
