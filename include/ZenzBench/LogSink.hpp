#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace zenzbench {

/**
 * Destination for harness diagnostics and ranking blocks.
 *
 * A sink is handed to the decoder, the benchmark runner and environment
 * assembly explicitly; nothing in the library registers a global callback.
 * Implementations must tolerate calls from the async worker threads.
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const std::string& line) = 0;
};

class StreamLogSink : public LogSink {
public:
    explicit StreamLogSink(std::ostream& out) : out_(out) {}

    void write(const std::string& line) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Keeps every line so callers can query the log after a run.
class MemoryLogSink : public LogSink {
public:
    void write(const std::string& line) override;

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] bool contains(const std::string& needle) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace zenzbench
