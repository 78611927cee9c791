#include <trialflow/io/error.hpp>
#include <trialflow/io/experiment_loader.hpp>

#include <trialflow/core/session.hpp>

#include <gtest/gtest.h>

using namespace trialflow::io;
using namespace trialflow::core;

class ExperimentLoaderTest : public ::testing::Test {};

TEST_F(ExperimentLoaderTest, LoadFullDefinition) {
    const char* json = R"({
        "settings": {"difficulty": 1},
        "settings_to_log": ["difficulty"],
        "custom_headers": ["response", "rt"],
        "ad_hoc_headers": true,
        "blocks": [
            {"trials": 3},
            {"trials": 2, "settings": {"difficulty": 2}}
        ]
    })";

    auto def = load_experiment_from_string(json);

    EXPECT_EQ(def.settings.at("difficulty").as_int(), 1);
    EXPECT_EQ(def.settings_to_log, (std::vector<std::string>{"difficulty"}));
    EXPECT_EQ(def.custom_headers, (std::vector<std::string>{"response", "rt"}));
    ASSERT_TRUE(def.ad_hoc_headers.has_value());
    EXPECT_TRUE(*def.ad_hoc_headers);
    ASSERT_EQ(def.blocks.size(), 2u);
    EXPECT_EQ(def.blocks[0].trials, 3u);
    EXPECT_TRUE(def.blocks[0].settings.empty());
    EXPECT_EQ(def.blocks[1].settings.at("difficulty").as_int(), 2);
}

TEST_F(ExperimentLoaderTest, EmptyObjectIsValid) {
    auto def = load_experiment_from_string("{}");
    EXPECT_TRUE(def.blocks.empty());
    EXPECT_FALSE(def.ad_hoc_headers.has_value());
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ExperimentLoaderTest, BlockRequiresTrials) {
    EXPECT_THROW((void)load_experiment_from_string(R"({"blocks": [{}]})"), IoError);
}

TEST_F(ExperimentLoaderTest, NegativeTrialsRejected) {
    EXPECT_THROW((void)load_experiment_from_string(R"({"blocks": [{"trials": -1}]})"), IoError);
}

TEST_F(ExperimentLoaderTest, WrongMemberTypesRejected) {
    EXPECT_THROW((void)load_experiment_from_string(R"({"blocks": {}})"), IoError);
    EXPECT_THROW((void)load_experiment_from_string(R"({"custom_headers": [1]})"), IoError);
    EXPECT_THROW((void)load_experiment_from_string(R"({"settings": []})"), IoError);
    EXPECT_THROW((void)load_experiment_from_string(R"({"ad_hoc_headers": "yes"})"), IoError);
}

TEST_F(ExperimentLoaderTest, ErrorNamesTheBlock) {
    try {
        (void)load_experiment_from_string(R"({"blocks": [{"trials": 1}, {"trials": "x"}]})");
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_NE(std::string(e.what()).find("blocks[1]"), std::string::npos);
    }
}

TEST_F(ExperimentLoaderTest, MissingFile) {
    EXPECT_THROW((void)load_experiment("/nonexistent/trialflow/experiment.json"), IoError);
}

// =============================================================================
// apply_definition
// =============================================================================

TEST_F(ExperimentLoaderTest, ApplyCreatesBlocksAndOptions) {
    auto def = load_experiment_from_string(R"({
        "settings_to_log": ["difficulty"],
        "custom_headers": ["rt"],
        "ad_hoc_headers": true,
        "blocks": [{"trials": 2}, {"trials": 1, "settings": {"difficulty": 5}}]
    })");

    Session session;
    apply_definition(session, def);

    EXPECT_EQ(session.block_count(), 2u);
    EXPECT_EQ(session.trial_count(), 3u);
    EXPECT_TRUE(session.options().ad_hoc_header_add);
    EXPECT_EQ(session.options().custom_headers, (std::vector<std::string>{"rt"}));
    EXPECT_EQ(session.options().settings_to_log, (std::vector<std::string>{"difficulty"}));
    EXPECT_EQ(session.block(2).settings().get_int("difficulty"), 5);
    EXPECT_EQ(session.trial(3).settings().get_int("difficulty"), 5);
}

TEST_F(ExperimentLoaderTest, ApplyKeepsAdHocWhenUnset) {
    SessionOptions options;
    options.ad_hoc_header_add = true;
    Session session(options);

    apply_definition(session, load_experiment_from_string("{}"));

    EXPECT_TRUE(session.options().ad_hoc_header_add);
}
