#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "tools/history_store.hpp"

namespace {

using nlohmann::json;
using rustmcp::tools::HistoryKind;
using rustmcp::tools::HistoryRecord;
using rustmcp::tools::HistoryStore;

HistoryRecord make_record(const std::string& file_name, HistoryKind kind = HistoryKind::Analysis) {
    HistoryRecord record;
    record.file_name = file_name;
    record.kind = kind;
    record.diagnostic_count = 2;
    record.suggestion_count = 1;
    record.explanation_length = 10;
    return record;
}

TEST(HistoryStoreTest, RecordAssignsIdAndTimestamp) {
    HistoryStore store;
    const HistoryRecord stored = store.record(make_record("main.rs"));

    EXPECT_EQ(stored.id.rfind("analysis-", 0), 0u);
    EXPECT_EQ(stored.id.size(), std::string("analysis-").size() + 8);
    EXPECT_GT(stored.timestamp_ms, 0);
    EXPECT_EQ(store.total(), 1u);
}

TEST(HistoryStoreTest, RecentIsNewestFirstAndLimited) {
    HistoryStore store;
    store.record(make_record("a.rs"));
    store.record(make_record("b.rs"));
    store.record(make_record("c.rs"));

    const auto recent = store.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].file_name, "c.rs");
    EXPECT_EQ(recent[1].file_name, "b.rs");
    EXPECT_EQ(store.recent(10).size(), 3u);
}

TEST(HistoryStoreTest, EvictsOldestBeyondCapacity) {
    HistoryStore store(2);
    store.record(make_record("a.rs"));
    store.record(make_record("b.rs"));
    store.record(make_record("c.rs"));

    EXPECT_EQ(store.total(), 2u);
    const auto recent = store.recent(5);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent.back().file_name, "b.rs");
}

TEST(HistoryStoreTest, JsonStatsDependOnKind) {
    HistoryStore store;
    const json analysis = to_json(store.record(make_record("a.rs", HistoryKind::Analysis)));
    EXPECT_EQ(analysis.at("type"), "analysis");
    EXPECT_EQ(analysis.at("fileName"), "a.rs");
    EXPECT_EQ(analysis.at("stats"), json({{"diagnosticCount", 2}}));

    const json suggestion = to_json(store.record(make_record("b.rs", HistoryKind::Suggestion)));
    EXPECT_EQ(suggestion.at("type"), "suggestion");
    EXPECT_EQ(suggestion.at("stats"), json({{"suggestionCount", 1}}));

    const json explanation = to_json(store.record(make_record("c.rs", HistoryKind::Explanation)));
    EXPECT_EQ(explanation.at("type"), "explanation");
    EXPECT_EQ(explanation.at("stats"), json({{"explanationLength", 10}}));
}

TEST(HistoryStoreTest, ConcurrentRecordsAreAllKept) {
    HistoryStore store(1000);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store]() {
            for (int i = 0; i < 50; ++i) {
                store.record(make_record("concurrent.rs"));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(store.total(), 200u);
}

}  // namespace
