#pragma once

#include <optional>
#include <string>

#include "cw/model.hpp"

namespace cw
{
// Forward declarations to avoid heavy includes in header
struct Progress;

// "YYYY-MM-DD HH:MM:SS", or "-" when absent
std::string expiry_display(const std::optional<TimePoint> &expiry);

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_header_text(const BatchResult &result);

std::string format_results_text(const BatchResult &result);

std::string format_summary_text(const Summary &summary);

// One bar per bucket in display order, scaled to `width` characters
std::string format_buckets_text(const BucketHistogram &buckets, int width = 40);

std::string format_latency_text(const Aggregation &latency, size_t count);

// Single line starting with '\r', no trailing newline
std::string format_progress_text(const Progress &progress, int width = 30);

// NDJSON record for one outcome (single line, no trailing newline)
std::string build_ndjson_outcome(const ProbeOutcome &outcome);

// Final JSON (single object string without trailing newline)
std::string build_final_json(const BatchResult &result);

// host,port,expiry,days_left,status,error with a header row, '\n' line ends
std::string build_csv(const BatchResult &result);
} // namespace cw
