#pragma once

#include "ZenzBench/ScoreTensor.hpp"

#include <cstddef>
#include <vector>

namespace zenzbench {

class LogSink;

/**
 * Vocabulary index with the highest score at (batch, time).
 *
 * Ties resolve to the lowest index. Out-of-range coordinates, or a buffer
 * too short for the requested row, log a diagnostic (to `log`, or stderr
 * when none is given) and return 0 instead of throwing, so one malformed
 * tensor cannot abort a benchmark sweep.
 *
 * F32 and F16 buffers are scanned through a typed pointer; any other
 * element type goes through ScoreTensor::value_at.
 */
[[nodiscard]] int argmax_row(const ScoreTensor& scores,
                             std::ptrdiff_t batch,
                             std::ptrdiff_t time,
                             LogSink* log = nullptr);

/// argmax_row for every time index of every batch row.
[[nodiscard]] std::vector<std::vector<int>> argmax_all_rows(const ScoreTensor& scores,
                                                            LogSink* log = nullptr);

} // namespace zenzbench
