#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cw {

using Clock     = std::chrono::system_clock;
// Whole seconds: certificate validity runs from year 0000 to 9999, well
// outside the range of the clock's native nanosecond time_point.
using TimePoint = std::chrono::sys_seconds;

inline TimePoint now_seconds()
{
    return std::chrono::floor<std::chrono::seconds>(Clock::now());
}

enum class Status { Ok, Warning, Error };

enum class ProbeErrorKind {
    None = 0,
    Connection,
    Handshake,
    CertificateParse,
    Internal,       // the probe itself threw
};

// Buckets in display order. Rows without days_left are never bucketed.
enum class Bucket {
    Expired = 0,   // <= 0
    Week,          // 1..7
    Month,         // 8..30
    Quarter,       // 31..90
    Year,          // 91..365
    Beyond,        // > 365
};

inline constexpr std::size_t kBucketCount = 6;

struct ProbeTarget {
    std::string host;
    int         port{443};
    std::size_t index{};    // position in the normalized host list
};

struct ProbeResult {
    double                   ms{};
    ProbeErrorKind           kind{ProbeErrorKind::None};
    std::string              error;     // set when kind != None
    std::optional<TimePoint> expiry;    // set when kind == None
};

struct ProbeOutcome {
    std::string              host;
    int                      port{};
    std::size_t              index{};
    std::optional<TimePoint> expiry;
    std::optional<int>       days_left;
    Status                   status{Status::Error};
    ProbeErrorKind           error_kind{ProbeErrorKind::None};
    std::string              error;
    double                   ms{};
};

struct Summary {
    std::size_t total{};
    std::size_t ok{};
    std::size_t warning{};
    std::size_t error{};
};

struct Aggregation {
    double min{};
    double avg{};
    double max{};
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

using BucketHistogram = std::array<std::pair<Bucket, std::size_t>, kBucketCount>;

struct BatchResult {
    std::vector<ProbeOutcome> outcomes;   // input order
    Summary                   summary;
    BucketHistogram           buckets{};
    Aggregation               latency;
    std::size_t               requested{};
    bool                      cancelled{false};
    TimePoint                 checked_at{};
    int                       port{};
    int                       warn_days{};
    int                       workers{};
};

} // namespace cw
