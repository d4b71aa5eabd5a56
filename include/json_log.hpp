#pragma once
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include <json/json.h>

namespace zt {

// One JSON object per line, appended. Used for measurement records.
class JsonLineLogger {
public:
    explicit JsonLineLogger(const std::string& path);

    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void write(const Json::Value& record);

private:
    std::mutex mu_;
    std::ofstream out_;
};

// Single-line rendering of a record.
std::string compact(const Json::Value& v);

// UTC "YYYY-mm-ddTHH:MM:SS.ffffff"
std::string utc_timestamp(std::chrono::system_clock::time_point t);

} // namespace zt
