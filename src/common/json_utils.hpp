#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace pagewatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Accepts the UTC form written above and also older records without a zone
// suffix or with fractional seconds; the trailing part is ignored.
inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toStatusString(CheckStatus status)
{
    switch (status) {
    case CheckStatus::Error:
        return "error";
    case CheckStatus::Initialized:
        return "initialized";
    case CheckStatus::NoChange:
        return "no-change";
    case CheckStatus::KeywordChange:
        return "keyword-change";
    case CheckStatus::ChangedButNoKeywords:
        return "changed-but-no-keywords";
    }
    return "error";
}

inline CheckStatus parseStatusString(const std::string &value)
{
    if (value == "initialized") {
        return CheckStatus::Initialized;
    }
    if (value == "no-change") {
        return CheckStatus::NoChange;
    }
    if (value == "keyword-change") {
        return CheckStatus::KeywordChange;
    }
    if (value == "changed-but-no-keywords") {
        return CheckStatus::ChangedButNoKeywords;
    }
    return CheckStatus::Error;
}

inline std::string toStoreBackendString(StoreBackend backend)
{
    switch (backend) {
    case StoreBackend::Files:
        return "files";
    case StoreBackend::Sqlite:
        return "sqlite";
    }
    return "files";
}

inline void to_json(nlohmann::json &j, const CheckStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, CheckStatus &status)
{
    if (j.is_string()) {
        status = parseStatusString(j.get<std::string>());
    } else {
        status = CheckStatus::Error;
    }
}

inline void to_json(nlohmann::json &j, const Target &target)
{
    j = nlohmann::json{
        {"url", target.url},
        {"keywords", target.keywords}
    };
}

inline void to_json(nlohmann::json &j, const CheckResult &result)
{
    j = nlohmann::json{
        {"url", result.url},
        {"status", result.status}
    };
    if (result.details.has_value()) {
        j["details"] = *result.details;
    }
    if (result.status == CheckStatus::KeywordChange) {
        j["matched_keywords"] = result.matchedKeywords;
    }
}

inline void from_json(const nlohmann::json &j, CheckResult &result)
{
    result.url = j.value("url", "");
    if (j.contains("status")) {
        result.status = j.at("status").get<CheckStatus>();
    } else {
        result.status = CheckStatus::Error;
    }
    if (j.contains("details") && j.at("details").is_string()) {
        result.details = j.at("details").get<std::string>();
    } else {
        result.details.reset();
    }
    if (j.contains("matched_keywords") && j.at("matched_keywords").is_array()) {
        result.matchedKeywords = j.at("matched_keywords").get<std::vector<std::string>>();
    } else {
        result.matchedKeywords.clear();
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"text", snapshot.text}
    };
}

} // namespace pagewatch
