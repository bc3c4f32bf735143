#include "pingwatch/trace_session.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pingwatch {

const char* trailer_text(TraceAnnotation annotation) {
    switch (annotation) {
    case TraceAnnotation::Completed:     return "--- completed ---";
    case TraceAnnotation::StoppedByUser: return "--- stopped by user ---";
    }
    return "--- completed ---";
}

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace


TraceSession::TraceSession(const std::vector<std::string>& addresses,
                           size_t max_concurrency,
                           const CancelToken& parent,
                           TraceCallbacks callbacks)
    : callbacks_(std::move(callbacks)),
      cancel_(parent),
      limiter_(max_concurrency)
{
    for (const auto& raw : addresses) {
        std::string a = trim(raw);
        if (a.empty()) continue;
        bool dup = std::any_of(entries_.begin(), entries_.end(),
                               [&a](const Entry& e) { return e.address == a; });
        if (dup) continue;

        Entry e;
        e.address = std::move(a);
        entries_.push_back(std::move(e));
    }
}

int TraceSession::index_of(const std::string& address) const {
    for (size_t i = 0; i < entries_.size(); ++i)
        if (entries_[i].address == address) return static_cast<int>(i);
    return -1;
}


// ============================================================================
// Buffers
// ============================================================================
void TraceSession::write_locked(Entry& e, const std::string& line) {
    e.buffer += line;
    e.buffer += '\n';
    if (callbacks_.on_line)
        callbacks_.on_line(e.address, line);
}

void TraceSession::write_trailer_locked(Entry& e, TraceAnnotation annotation) {
    e.trailer_written = true;
    write_locked(e, trailer_text(annotation));
    if (callbacks_.on_annotation)
        callbacks_.on_annotation(e.address, annotation);
}

void TraceSession::append_line(size_t i, const std::string& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    Entry& e = entries_.at(i);
    if (e.trailer_written) return;
    write_locked(e, line);
}

void TraceSession::broadcast(const std::string& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& e : entries_)
        write_locked(e, line);
}


// ============================================================================
// Completion bookkeeping
// ============================================================================
bool TraceSession::finish(size_t i, TraceOutcome outcome) {
    bool wrote = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Entry& e = entries_.at(i);

        if (!e.stop_annotated && !e.trailer_written) {
            if (outcome == TraceOutcome::Cancelled) {
                e.stop_annotated = true;
                write_trailer_locked(e, TraceAnnotation::StoppedByUser);
            } else {
                write_trailer_locked(e, TraceAnnotation::Completed);
            }
            wrote = true;
        }
        e.completed = true;
    }
    cv_.notify_all();
    return wrote;
}

std::vector<std::string> TraceSession::annotate_unfinished() {
    std::vector<std::string> annotated;
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& e : entries_) {
        if (e.completed || e.stop_annotated) continue;
        e.stop_annotated = true;
        write_trailer_locked(e, TraceAnnotation::StoppedByUser);
        annotated.push_back(e.address);
    }
    return annotated;
}

void TraceSession::wait_done() {
    CancelRegistration reg = cancel_.token().on_cancel([this] {
        std::lock_guard<std::mutex> lk(mtx_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return all_completed_locked() || cancel_.cancelled(); });
}


// ============================================================================
// Queries
// ============================================================================
bool TraceSession::all_completed_locked() const {
    return std::all_of(entries_.begin(), entries_.end(),
                       [](const Entry& e) { return e.completed; });
}

bool TraceSession::all_completed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return all_completed_locked();
}

bool TraceSession::completed(size_t i) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.at(i).completed;
}

bool TraceSession::stop_annotated(size_t i) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.at(i).stop_annotated;
}

std::string TraceSession::transcript(size_t i) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.at(i).buffer;
}

} // namespace pingwatch
