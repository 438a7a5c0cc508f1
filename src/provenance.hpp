#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One processing step applied to a dataset
struct LogEntry {
    std::string method;
    nlohmann::json parameters = nlohmann::json::object();
    std::string timestamp;  // ISO 8601, UTC

    bool operator==(const LogEntry& o) const {
        return method == o.method && parameters == o.parameters && timestamp == o.timestamp;
    }
};

/// Ordered provenance record carried by label images and mask collections.
/// Entries are only ever appended by callers.
class Log {
public:
    Log() = default;

    void append(const std::string& method, nlohmann::json parameters);
    void append(LogEntry entry) { entries_.push_back(std::move(entry)); }

    const std::vector<LogEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    nlohmann::json toJson() const;
    static Log fromJson(const nlohmann::json& j);

    bool operator==(const Log& o) const { return entries_ == o.entries_; }
    bool operator!=(const Log& o) const { return !(*this == o); }

private:
    std::vector<LogEntry> entries_;
};

std::string utcTimestamp();
