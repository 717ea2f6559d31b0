#pragma once

#include <vector>

#include "cw/model.hpp"

namespace cw {

Summary summarize(const std::vector<ProbeOutcome>& outcomes);

// All buckets in display order, zeros kept. Outcomes without days_left are
// not counted.
BucketHistogram bucket_histogram(const std::vector<ProbeOutcome>& outcomes);

// Latency min/avg/max plus one nearest-rank value per requested percentile,
// in request order. p is clamped to 0..100. Empty input gives all zeros.
Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl);

} // namespace cw
