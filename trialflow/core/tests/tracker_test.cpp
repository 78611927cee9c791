#include <trialflow/core/error.hpp>
#include <trialflow/core/tracker.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace trialflow::core;

namespace {

class CounterTracker : public Tracker {
public:
    CounterTracker()
        : Tracker("hand", "movement", {"x", "y"}) {}

    std::vector<std::string> next{"1", "2"};
    int calls{0};

protected:
    std::vector<std::string> current_values() override {
        ++calls;
        return next;
    }
};

class FixedHeaderTracker : public Tracker {
public:
    explicit FixedHeaderTracker(std::vector<std::string> header)
        : Tracker("gaze", "position", std::move(header)) {}

protected:
    std::vector<std::string> current_values() override { return {}; }
};

} // namespace

class TrackerTest : public ::testing::Test {
protected:
    CounterTracker tracker_;
};

TEST_F(TrackerTest, Naming) {
    EXPECT_EQ(tracker_.data_name(), "hand_movement");
    EXPECT_EQ(tracker_.header(), (std::vector<std::string>{"time", "x", "y"}));
    EXPECT_EQ(tracker_.object_name(), "hand");
    EXPECT_EQ(tracker_.measurement_descriptor(), "movement");
}

TEST_F(TrackerTest, SampleIgnoredWhenNotRecording) {
    tracker_.sample(0.0);
    EXPECT_EQ(tracker_.row_count(), 0U);
    EXPECT_EQ(tracker_.calls, 0);
}

TEST_F(TrackerTest, SampleAppendsTimeAndValues) {
    tracker_.start_recording();
    tracker_.sample(0.5);
    tracker_.next = {"3", "4"};
    tracker_.sample(1.0);

    DataTable data = tracker_.data();
    ASSERT_EQ(data.row_count(), 2U);
    EXPECT_EQ(data.rows()[0], (std::vector<std::string>{"0.5", "1", "2"}));
    EXPECT_EQ(data.rows()[1], (std::vector<std::string>{"1", "3", "4"}));
}

TEST_F(TrackerTest, WidthMismatchIsFatal) {
    tracker_.start_recording();
    tracker_.next = {"1"};
    EXPECT_THROW(tracker_.sample(0.0), SchemaViolationError);
    EXPECT_EQ(tracker_.row_count(), 0U);
}

TEST_F(TrackerTest, MalformedHeaderRejectedAtConstruction) {
    EXPECT_THROW(FixedHeaderTracker({"x", "x"}), SchemaViolationError);
    EXPECT_THROW(FixedHeaderTracker({"time", "x"}), SchemaViolationError);
    EXPECT_NO_THROW(FixedHeaderTracker({"x", "y"}));
}

TEST_F(TrackerTest, StartRecordingClearsBuffer) {
    tracker_.start_recording();
    tracker_.sample(0.0);
    tracker_.stop_recording();
    EXPECT_EQ(tracker_.row_count(), 1U);

    tracker_.start_recording();
    EXPECT_EQ(tracker_.row_count(), 0U);
}

TEST_F(TrackerTest, PauseKeepsBuffer) {
    tracker_.start_recording();
    tracker_.sample(0.0);
    tracker_.pause_recording();
    tracker_.sample(1.0);

    EXPECT_FALSE(tracker_.recording());
    EXPECT_EQ(tracker_.row_count(), 1U);
}

TEST_F(TrackerTest, DataIsSnapshot) {
    tracker_.start_recording();
    tracker_.sample(0.0);
    DataTable snapshot = tracker_.data();
    tracker_.sample(1.0);

    EXPECT_EQ(snapshot.row_count(), 1U);
    EXPECT_EQ(tracker_.row_count(), 2U);
}
