#include <trialflow/core/error.hpp>
#include <trialflow/core/result_row.hpp>

#include <gtest/gtest.h>

using namespace trialflow::core;

class ResultRowTest : public ::testing::Test {
protected:
    std::vector<std::string> headers_{"trial_num", "score", "rt"};
};

TEST_F(ResultRowTest, SeededWithNullsInOrder) {
    ResultRow row(headers_);
    EXPECT_EQ(row.keys(), headers_);
    EXPECT_TRUE(row.at("score").is_null());
    EXPECT_FALSE(row.ad_hoc());
}

TEST_F(ResultRowTest, DuplicateHeadersSeededOnce) {
    ResultRow row({"a", "b", "a"});
    EXPECT_EQ(row.size(), 2U);
}

TEST_F(ResultRowTest, SetDeclaredColumn) {
    ResultRow row(headers_);
    row.set("score", 10);
    row["rt"] = 0.35;

    EXPECT_EQ(row.at("score").as_int(), 10);
    EXPECT_DOUBLE_EQ(row.at("rt").as_double(), 0.35);
}

TEST_F(ResultRowTest, StrictRejectsUndeclared) {
    ResultRow row(headers_);
    EXPECT_THROW(row.set("bonus", 1), SchemaViolationError);
    EXPECT_THROW(row["bonus"], SchemaViolationError);
    EXPECT_FALSE(row.contains("bonus"));
}

TEST_F(ResultRowTest, AdHocAppendsUndeclared) {
    ResultRow row(headers_, true);
    row["bonus"] = 5;

    ASSERT_TRUE(row.contains("bonus"));
    EXPECT_EQ(row.keys().back(), "bonus");
}

TEST_F(ResultRowTest, AddColumnBypassesStrictMode) {
    ResultRow row(headers_);
    row.add_column("movement_location_0", "trackers/movement_T001.csv");
    EXPECT_EQ(row.at("movement_location_0").as_string(), "trackers/movement_T001.csv");
}

TEST_F(ResultRowTest, AtUnknownThrows) {
    ResultRow row(headers_);
    EXPECT_THROW((void)row.at("nope"), SchemaViolationError);
}

TEST_F(ResultRowTest, DefaultRowIsAdHoc) {
    ResultRow row;
    row["anything"] = "goes";
    EXPECT_TRUE(row.ad_hoc());
    EXPECT_EQ(row.size(), 1U);
}
