#pragma once

#include <cstddef>
#include <cstdint>

namespace Ftsb {

/// Default number of records grouped into one batch
const size_t kDefaultBatchSize = 1000;
/// Buffered read size for the input stream (4 MB)
const size_t kDefaultReadSize = 4 << 20;
/// Default pipeline flush threshold
const size_t kDefaultPipeline = 50;

/// work-queues value selecting one queue per worker
const int kWorkerPerQueue = 0;

/// Histogram bounds (microseconds) and precision
const int64_t kHistogramLowest = 1;
const int64_t kHistogramHighest = 1000000;
const int kHistogramSignificantFigures = 3;

/// Emitted in every result document
constexpr const char* kResultFormatVersion = "0.1";

/// Substituted for NaN/inf ratios and rates
constexpr double kInvalidMetric = -1.0;

}  // namespace Ftsb
