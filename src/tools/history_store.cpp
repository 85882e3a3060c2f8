#include "tools/history_store.hpp"

#include <chrono>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace rustmcp::tools {

using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

std::string to_string(const HistoryKind kind) {
    switch (kind) {
        case HistoryKind::Analysis:
            return "analysis";
        case HistoryKind::Suggestion:
            return "suggestion";
        case HistoryKind::Explanation:
            return "explanation";
        default:
            return "unknown";
    }
}

HistoryStore::HistoryStore(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

HistoryRecord HistoryStore::record(HistoryRecord record) {
    if (record.id.empty()) {
        record.id = core::config::generate_id("analysis");
    }
    if (record.timestamp_ms == 0) {
        record.timestamp_ms = now_unix_ms();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
    LOG_DEBUG("HistoryStore: recorded " + to_string(record.kind) + " " + record.id);
    return record;
}

std::vector<HistoryRecord> HistoryStore::recent(const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::size_t HistoryStore::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

json to_json(const HistoryRecord& record) {
    json stats = json::object();
    switch (record.kind) {
        case HistoryKind::Analysis:
            stats["diagnosticCount"] = record.diagnostic_count;
            break;
        case HistoryKind::Suggestion:
            stats["suggestionCount"] = record.suggestion_count;
            break;
        case HistoryKind::Explanation:
            stats["explanationLength"] = record.explanation_length;
            break;
    }
    return json{{"id", record.id},
                {"timestamp", record.timestamp_ms},
                {"fileName", record.file_name},
                {"type", to_string(record.kind)},
                {"stats", stats}};
}

}  // namespace rustmcp::tools
