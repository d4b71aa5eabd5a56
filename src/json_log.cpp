#include "json_log.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace zt {

JsonLineLogger::JsonLineLogger(const std::string& path) : out_(path, std::ios::app) {}

std::string compact(const Json::Value& v) {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    return Json::writeString(b, v); // invalid UTF-8 comes out as U+FFFD
}

void JsonLineLogger::write(const Json::Value& record) {
    std::string line = compact(record);
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open()) return;
    out_ << line << '\n';
    out_.flush();
}

std::string utc_timestamp(std::chrono::system_clock::time_point t) {
    using namespace std::chrono;
    auto tt = system_clock::to_time_t(t);
    auto us = duration_cast<microseconds>(t.time_since_epoch()) % 1000000;
    if (us.count() < 0) us += seconds(1);

    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << us.count();
    return oss.str();
}

} // namespace zt
