#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rustmcp::tools {

enum class HistoryKind {
    Analysis,
    Suggestion,
    Explanation
};

struct HistoryRecord {
    std::string id;
    std::int64_t timestamp_ms = 0;
    std::string file_name;
    HistoryKind kind = HistoryKind::Analysis;
    std::size_t diagnostic_count = 0;
    std::size_t suggestion_count = 0;
    std::size_t explanation_length = 0;
};

// In-memory, bounded log of completed analyses. Oldest records are evicted
// first. Shared by every session, so all access goes through the mutex.
class HistoryStore {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit HistoryStore(std::size_t capacity = kDefaultCapacity);

    // Fills in id and timestamp; returns the stored copy.
    HistoryRecord record(HistoryRecord record);

    // Newest first, at most `limit` entries.
    std::vector<HistoryRecord> recent(std::size_t limit) const;

    std::size_t total() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<HistoryRecord> records_;
};

std::string to_string(HistoryKind kind);

// {id, timestamp, fileName, type, stats}
nlohmann::json to_json(const HistoryRecord& record);

}  // namespace rustmcp::tools
