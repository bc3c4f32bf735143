#pragma once
#include <chrono>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace pingwatch {

/**
 * Optional diagnostics file, appended to across runs.
 *
 * Layout:
 *   >>> pingwatch pid 4242 opened 2026/10/18 09:00:00
 *   2026/10/18 09:00:00.125 +0.002s monitoring started: 3 targets, ...
 *   <<< pingwatch pid 4242 closed 2026/10/18 09:05:12, 17 entries
 *
 * Components take a nullable DiagLogger*; nullptr means no logging.
 */
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void log(const std::string& line);

    /** Entries written since the file was opened. */
    size_t entries() const;

private:
    mutable std::mutex mtx_;
    std::ofstream out_;
    std::chrono::steady_clock::time_point opened_;
    size_t entries_{0};
};

/**
 * Null-safe convenience wrapper.
 */
inline void diag_log(DiagLogger* diag, const std::string& line) {
    if (diag) diag->log(line);
}

} // namespace pingwatch
