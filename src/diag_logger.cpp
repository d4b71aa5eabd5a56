// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace zt {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

DiagLogger::DiagLogger(const std::string& path) : out_(path, std::ios::app) {
    if (out_.is_open()) out_ << "=== zerotrace diag start " << now_ts() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== zerotrace diag end " << now_ts() << " ===\n";
}

void DiagLogger::log(const std::string& line) {
    write(nullptr, line);
}

void DiagLogger::error(const std::string& line) {
    write("ERROR ", line);
}

void DiagLogger::write(const char* tag, const std::string& line) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open()) return;
    out_ << now_ts() << " | " << (tag ? tag : "") << line << '\n';
    out_.flush();
}

} // namespace zt
