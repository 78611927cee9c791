#include <trialflow/io/event_writers.hpp>
#include <trialflow/io/json.hpp>

#include <trialflow/core/session.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <sstream>

using namespace trialflow::io;
using namespace trialflow::core;

class EventWritersTest : public ::testing::Test {};

// =============================================================================
// JsonEventWriter
// =============================================================================

TEST_F(EventWritersTest, JsonEmptyArray) {
    std::ostringstream out;
    {
        JsonEventWriter writer(out);
    }
    EXPECT_EQ(out.str(), "[\n]\n");
}

TEST_F(EventWritersTest, JsonRecordsAreValidJson) {
    std::ostringstream out;
    JsonEventWriter writer(out);

    writer.begin(1.5);
    writer.type("trial_end");
    writer.field("trial", int64_t{3});
    writer.field("duration", 0.25);
    writer.field("note", std::string_view("a \"quoted\" value"));
    writer.end();

    writer.begin(2.0);
    writer.type("session_end");
    writer.end();
    writer.finalize();

    auto parsed = parse_json(out.str());
    const auto& records = parsed.as_array();
    ASSERT_EQ(records.size(), 2u);
    const auto& first = records[0].as_object();
    EXPECT_DOUBLE_EQ(first.at("time").as_double(), 1.5);
    EXPECT_EQ(first.at("type").as_string(), "trial_end");
    EXPECT_EQ(first.at("trial").as_int(), 3);
    EXPECT_DOUBLE_EQ(first.at("duration").as_double(), 0.25);
    EXPECT_EQ(first.at("note").as_string(), "a \"quoted\" value");
    EXPECT_EQ(records[1].as_object().at("type").as_string(), "session_end");
}

TEST_F(EventWritersTest, JsonFinalizeIdempotent) {
    std::ostringstream out;
    JsonEventWriter writer(out);
    writer.finalize();
    writer.finalize();
    EXPECT_EQ(out.str(), "[\n]\n");
}

// =============================================================================
// MemoryEventWriter
// =============================================================================

TEST_F(EventWritersTest, MemoryRecordsFields) {
    MemoryEventWriter writer;
    writer.begin(0.5);
    writer.type("session_begin");
    writer.field("session", int64_t{1});
    writer.field("experiment", std::string_view("stroop"));
    writer.end();

    ASSERT_EQ(writer.records().size(), 1u);
    const auto& record = writer.records()[0];
    EXPECT_DOUBLE_EQ(record.time, 0.5);
    EXPECT_EQ(record.type, "session_begin");
    EXPECT_EQ(std::get<int64_t>(record.fields.at("session")), 1);
    EXPECT_EQ(std::get<std::string>(record.fields.at("experiment")), "stroop");
    EXPECT_EQ(writer.count("session_begin"), 1u);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// =============================================================================
// TextEventWriter
// =============================================================================

TEST_F(EventWritersTest, TextLineFormat) {
    std::ostringstream out;
    TextEventWriter writer(out);

    writer.begin(12.5);
    writer.type("trial_end");
    writer.field("trial", int64_t{3});
    writer.field("duration", 1.25);
    writer.end();

    EXPECT_EQ(out.str(), "[    12.50000]        trial_end: trial = 3, duration = 1.25\n");
}

TEST_F(EventWritersTest, TextLineWithoutFields) {
    std::ostringstream out;
    TextEventWriter writer(out);
    writer.begin(0.0);
    writer.type("session_end");
    writer.end();

    EXPECT_EQ(out.str(), "[     0.00000]      session_end:\n");
}

// =============================================================================
// Session integration
// =============================================================================

TEST_F(EventWritersTest, SessionLogsLifecycle) {
    namespace fs = std::filesystem;
    auto base = fs::temp_directory_path() /
                ("trialflow_event_writers_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(base);

    MemoryEventWriter writer;
    {
        double now = 0.0;
        SessionOptions options;
        options.copy_settings = false;
        Session session(options, [&now] { return now; });
        session.set_event_writer(&writer);
        session.create_block(2);
        session.begin("exp", "p01", base);
        for (int i = 0; i < 2; ++i) {
            now += 1.0;
            session.begin_next_trial();
            now += 0.5;
            session.end_current_trial();
        }
        session.end();
    }
    fs::remove_all(base);

    EXPECT_EQ(writer.count("session_begin"), 1u);
    EXPECT_EQ(writer.count("trial_begin"), 2u);
    EXPECT_EQ(writer.count("trial_end"), 2u);
    EXPECT_EQ(writer.count("results_saved"), 1u);
    EXPECT_EQ(writer.count("session_end"), 1u);

    const auto& trial_end = writer.records()[2];
    EXPECT_EQ(trial_end.type, "trial_end");
    EXPECT_DOUBLE_EQ(trial_end.time, 1.5);
    EXPECT_DOUBLE_EQ(std::get<double>(trial_end.fields.at("duration")), 0.5);
}
