#include <trialflow/io/error.hpp>
#include <trialflow/io/file_saver.hpp>

#include <trialflow/core/session.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace trialflow::io;
using namespace trialflow::core;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace

class FileSaverTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() /
                ("trialflow_file_saver_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(base_);
        worker_.begin();
    }

    void TearDown() override {
        worker_.end();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    DataTarget target(std::string name, DataType type) {
        DataTarget t;
        t.experiment = "exp";
        t.participant = "p01";
        t.session_number = 1;
        t.name = std::move(name);
        t.type = type;
        return t;
    }

    fs::path session_dir() const { return base_ / "exp" / "p01" / "S001"; }

    fs::path base_;
    PersistenceWorker worker_;
};

// =============================================================================
// Layout
// =============================================================================

TEST_F(FileSaverTest, DirectoryPerDataType) {
    FileSaver saver(worker_, base_);

    EXPECT_EQ(saver.path_for(target("trial_results", DataType::Trials), ".csv"),
              session_dir() / "trial_results.csv");
    EXPECT_EQ(saver.path_for(target("hand_T001", DataType::Trackers), ".csv"),
              session_dir() / "trackers" / "hand_T001.csv");
    EXPECT_EQ(saver.path_for(target("settings", DataType::SessionInfo), ".json"),
              session_dir() / "session_info" / "settings.json");
    EXPECT_EQ(saver.path_for(target("notes", DataType::Other), ".txt"),
              session_dir() / "other" / "notes.txt");
}

TEST_F(FileSaverTest, RelativeLocations) {
    FileSaver saver(worker_, base_);
    DataTable table({"a"});

    EXPECT_EQ(saver.handle_table(table, target("hand_T001", DataType::Trackers)), "trackers/hand_T001.csv");
    EXPECT_EQ(saver.handle_table(table, target("trial_results", DataType::Trials)), "trial_results.csv");
}

TEST_F(FileSaverTest, AbsoluteLocations) {
    FileSaver saver(worker_, base_, false);
    auto location = saver.handle_text("x", target("notes", DataType::Other));
    EXPECT_EQ(location, (session_dir() / "other" / "notes.txt").generic_string());
}

// =============================================================================
// Content
// =============================================================================

TEST_F(FileSaverTest, WritesCsv) {
    FileSaver saver(worker_, base_);
    DataTable table({"time", "x"});
    table.add_row({"0", "1,5"});
    table.add_row({"1", "2"});

    saver.handle_table(table, target("hand_T001", DataType::Trackers));
    worker_.drain();

    EXPECT_EQ(read_file(session_dir() / "trackers" / "hand_T001.csv"), "time,x\n0,1_5\n1,2\n");
}

TEST_F(FileSaverTest, WritesJson) {
    FileSaver saver(worker_, base_);
    saver.handle_json(Value(Object{{"speed", 2}}), target("settings", DataType::SessionInfo));
    worker_.drain();

    EXPECT_EQ(read_file(session_dir() / "session_info" / "settings.json"), R"({"speed":2})");
}

TEST_F(FileSaverTest, WritesTextAndBytes) {
    FileSaver saver(worker_, base_);
    const std::vector<std::uint8_t> bytes{0x00, 0x01, 0xff};
    saver.handle_text("line\n", target("notes", DataType::Other));
    saver.handle_bytes(bytes, target("blob", DataType::Other));
    worker_.drain();

    EXPECT_EQ(read_file(session_dir() / "other" / "notes.txt"), "line\n");
    EXPECT_EQ(read_file(session_dir() / "other" / "blob.bin"), std::string("\x00\x01\xff", 3));
}

TEST_F(FileSaverTest, PayloadCopiedAtSubmission) {
    FileSaver saver(worker_, base_);
    DataTable table({"a"});
    table.add_row({"1"});
    saver.handle_table(table, target("t", DataType::Other));
    table.add_row({"2"});
    worker_.drain();

    EXPECT_EQ(read_file(session_dir() / "other" / "t.csv"), "a\n1\n");
}

TEST_F(FileSaverTest, LaterWriteOverwrites) {
    FileSaver saver(worker_, base_);
    saver.handle_text("first", target("notes", DataType::Other));
    saver.handle_text("second", target("notes", DataType::Other));
    worker_.drain();

    EXPECT_EQ(read_file(session_dir() / "other" / "notes.txt"), "second");
}

TEST_F(FileSaverTest, WriteFailureReportedByWorker) {
    // A regular file where the experiment directory should be.
    std::ofstream(base_ / "exp") << "blocker";
    FileSaver saver(worker_, base_);
    saver.handle_text("x", target("notes", DataType::Other));

    EXPECT_THROW(worker_.drain(), IoError);
}

// =============================================================================
// With a session
// =============================================================================

TEST_F(FileSaverTest, SessionWritesResultsFile) {
    SessionOptions options;
    options.custom_headers = {"rt"};
    Session session(options);
    FileSaver saver(session.persistence_worker(), base_);
    session.add_data_handler(saver);
    session.create_block(2);

    session.begin("exp", "p01", base_, 1, Object{{"age", 30}}, Object{{"speed", 1}});
    for (int i = 0; i < 2; ++i) {
        session.begin_next_trial();
        session.current_trial().result()["rt"] = 0.5;
        session.end_current_trial();
    }
    session.end();

    const fs::path results = session_dir() / "trial_results.csv";
    ASSERT_TRUE(fs::exists(results));
    std::ifstream file(results);
    std::string line;
    int lines = 0;
    while (std::getline(file, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, 3);
    EXPECT_TRUE(fs::exists(session_dir() / "session_info" / "settings.json"));
    EXPECT_TRUE(fs::exists(session_dir() / "session_info" / "participant_details.csv"));
}
