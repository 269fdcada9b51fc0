#include "ZenzBench/ScoreReader.hpp"

#include "ZenzBench/LogSink.hpp"

#include <iostream>
#include <limits>
#include <sstream>
#include <string>

namespace zenzbench {

namespace {

void report(LogSink* log, const std::string& message) {
    if (log != nullptr) {
        log->write(message);
    } else {
        std::cerr << message << std::endl;
    }
}

std::string describe_shape(const ScoreTensor& scores) {
    std::ostringstream oss;
    oss << "[" << scores.batch_size() << ", " << scores.time_size() << ", "
        << scores.vocab_size() << "]";
    return oss.str();
}

template<typename T>
int scan_row(const T* row, std::size_t vocab_size) {
    int best_id = 0;
    float best_score = -std::numeric_limits<float>::infinity();
    for (std::size_t v = 0; v < vocab_size; ++v) {
        const float score = static_cast<float>(row[v]);
        if (score > best_score) {
            best_score = score;
            best_id = static_cast<int>(v);
        }
    }
    return best_id;
}

} // namespace

int argmax_row(const ScoreTensor& scores, std::ptrdiff_t batch, std::ptrdiff_t time, LogSink* log) {
    const auto batch_size = static_cast<std::ptrdiff_t>(scores.batch_size());
    const auto time_size = static_cast<std::ptrdiff_t>(scores.time_size());
    const std::size_t vocab_size = scores.vocab_size();

    if (batch < 0 || batch >= batch_size || time < 0 || time >= time_size) {
        std::ostringstream oss;
        oss << "[ScoreReader] Invalid indices: batch=" << batch << ", time=" << time
            << ", shape=" << describe_shape(scores);
        report(log, oss.str());
        return 0;
    }

    // Row index and offset are checked before computing them so a corrupted
    // shape cannot wrap back into range.
    const std::size_t total = scores.element_count();
    const std::size_t max = std::numeric_limits<std::size_t>::max();
    const auto b = static_cast<std::size_t>(batch);
    const auto t = static_cast<std::size_t>(time);
    const bool row_overflows = b > (max - t) / scores.time_size();
    const std::size_t row = row_overflows ? max : b * scores.time_size() + t;
    if (vocab_size == 0 || row_overflows || row >= total / vocab_size) {
        std::ostringstream oss;
        oss << "[ScoreReader] Out-of-bounds: batch=" << batch << ", time=" << time
            << ", vocabSize=" << vocab_size << ", totalCount=" << total
            << ", shape=" << describe_shape(scores);
        report(log, oss.str());
        return 0;
    }
    const std::size_t base = row * vocab_size;

    if (const float* data = scores.data<float>()) {
        return scan_row(data + base, vocab_size);
    }
    if (const Eigen::half* data = scores.data<Eigen::half>()) {
        return scan_row(data + base, vocab_size);
    }

    int best_id = 0;
    float best_score = -std::numeric_limits<float>::infinity();
    for (std::size_t v = 0; v < vocab_size; ++v) {
        const float score = scores.value_at(base + v);
        if (score > best_score) {
            best_score = score;
            best_id = static_cast<int>(v);
        }
    }
    return best_id;
}

std::vector<std::vector<int>> argmax_all_rows(const ScoreTensor& scores, LogSink* log) {
    std::vector<std::vector<int>> ids(scores.batch_size());
    for (std::size_t b = 0; b < scores.batch_size(); ++b) {
        ids[b].reserve(scores.time_size());
        for (std::size_t t = 0; t < scores.time_size(); ++t) {
            ids[b].push_back(argmax_row(scores,
                                        static_cast<std::ptrdiff_t>(b),
                                        static_cast<std::ptrdiff_t>(t),
                                        log));
        }
    }
    return ids;
}

} // namespace zenzbench
