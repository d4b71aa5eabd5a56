// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace zt {

// Append-only diagnostic log shared by the engine threads.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void log(const std::string& line);
    void error(const std::string& line);

private:
    void write(const char* tag, const std::string& line);

    std::mutex mu_;
    std::ofstream out_;
};

} // namespace zt
