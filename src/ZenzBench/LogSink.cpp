#include "ZenzBench/LogSink.hpp"

#include <algorithm>

namespace zenzbench {

void StreamLogSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line;
    if (line.empty() || line.back() != '\n') {
        out_ << '\n';
    }
    out_.flush();
}

void MemoryLogSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
}

std::vector<std::string> MemoryLogSink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

bool MemoryLogSink::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

} // namespace zenzbench
