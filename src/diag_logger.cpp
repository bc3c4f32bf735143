#include "pingwatch/diag_logger.hpp"
#include "pingwatch/util.hpp"

#include <cstdio>
#include <unistd.h>

namespace pingwatch {

// "yyyy/mm/dd hh:mm:ss.mmm" in local time
static std::string stamp_ms(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const long ms = static_cast<long>(
        duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000);

    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03ld", ms);
    return format_time(tp) + frac;
}

DiagLogger::DiagLogger(const std::string& path)
    : opened_(std::chrono::steady_clock::now())
{
    if (path.empty()) return;
    out_.open(path, std::ios::app);
    if (out_.is_open()) {
        out_ << ">>> pingwatch pid " << ::getpid() << " opened "
             << format_time(std::chrono::system_clock::now()) << "\n";
        out_.flush();
    }
}

DiagLogger::~DiagLogger() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!out_.is_open()) return;
    out_ << "<<< pingwatch pid " << ::getpid() << " closed "
         << format_time(std::chrono::system_clock::now())
         << ", " << entries_ << " entries\n";
}

void DiagLogger::log(const std::string& line) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - opened_).count();

    char offset[32];
    std::snprintf(offset, sizeof(offset), "+%lld.%03llds",
                  static_cast<long long>(elapsed / 1000),
                  static_cast<long long>(elapsed % 1000));

    std::lock_guard<std::mutex> lk(mtx_);
    if (!out_.is_open()) return;
    out_ << stamp_ms(std::chrono::system_clock::now()) << ' ' << offset << ' ' << line << '\n';
    out_.flush();
    ++entries_;
}

size_t DiagLogger::entries() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_;
}

} // namespace pingwatch
