#include <trialflow/io/memory_data_handler.hpp>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace trialflow::io;
using namespace trialflow::core;

class MemoryDataHandlerTest : public ::testing::Test {
protected:
    DataTarget target(std::string name, DataType type = DataType::Other) {
        DataTarget t;
        t.experiment = "exp";
        t.participant = "p01";
        t.session_number = 2;
        t.name = std::move(name);
        t.type = type;
        return t;
    }

    MemoryDataHandler handler_;
};

TEST_F(MemoryDataHandlerTest, LocationIsMemoryUri) {
    auto location = handler_.handle_text("hello", target("notes"));
    EXPECT_EQ(location, "memory://exp/p01/S002/notes");
}

TEST_F(MemoryDataHandlerTest, StoresCopies) {
    DataTable table({"a"});
    table.add_row({"1"});
    handler_.handle_table(table, target("results", DataType::Trials));
    table.add_row({"2"});

    auto stored = handler_.find("results");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->target.type, DataType::Trials);
    EXPECT_EQ(std::get<DataTable>(stored->payload).row_count(), 1u);
}

TEST_F(MemoryDataHandlerTest, AllPayloadKinds) {
    const std::vector<std::uint8_t> bytes{0xde, 0xad};
    handler_.handle_json(Value(Object{{"k", 1}}), target("json"));
    handler_.handle_text("txt", target("text"));
    handler_.handle_bytes(bytes, target("bytes"));

    EXPECT_EQ(handler_.size(), 3u);
    EXPECT_EQ(std::get<Value>(handler_.find("json")->payload).as_object().at("k").as_int(), 1);
    EXPECT_EQ(std::get<std::string>(handler_.find("text")->payload), "txt");
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(handler_.find("bytes")->payload), bytes);
}

TEST_F(MemoryDataHandlerTest, FindReturnsLatest) {
    handler_.handle_text("first", target("notes"));
    handler_.handle_text("second", target("notes"));

    EXPECT_EQ(std::get<std::string>(handler_.find("notes")->payload), "second");
    EXPECT_FALSE(handler_.find("missing").has_value());
}

TEST_F(MemoryDataHandlerTest, Clear) {
    handler_.handle_text("x", target("notes"));
    handler_.clear();
    EXPECT_EQ(handler_.size(), 0u);
}

TEST_F(MemoryDataHandlerTest, ConcurrentWrites) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 50; ++i) {
                handler_.handle_text("x", target("t" + std::to_string(t)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(handler_.size(), 200u);
}
