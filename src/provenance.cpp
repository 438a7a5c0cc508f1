#include "provenance.hpp"
#include "error.hpp"
#include <ctime>

std::string utcTimestamp() {
    char buf[32];
    time_t now = time(nullptr);
    struct tm tmv;
    gmtime_r(&now, &tmv);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmv);
    return buf;
}

void Log::append(const std::string& method, nlohmann::json parameters) {
    LogEntry e;
    e.method = method;
    e.parameters = std::move(parameters);
    e.timestamp = utcTimestamp();
    entries_.push_back(std::move(e));
}

nlohmann::json Log::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : entries_) {
        out.push_back({{"method", e.method}, {"parameters", e.parameters}, {"timestamp", e.timestamp}});
    }
    return out;
}

Log Log::fromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        error("%s: provenance log must be a JSON array", __func__);
    }
    Log log;
    for (const auto& item : j) {
        LogEntry e;
        e.method = item.at("method").get<std::string>();
        if (item.contains("parameters")) e.parameters = item.at("parameters");
        if (item.contains("timestamp")) e.timestamp = item.at("timestamp").get<std::string>();
        log.entries_.push_back(std::move(e));
    }
    return log;
}
