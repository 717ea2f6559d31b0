#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "cw/concurrency.hpp"
#include "cw/model.hpp"
#include "cw/prober.hpp"

namespace cw {

struct BatchRequest {
    std::vector<std::string> hosts;       // raw; trimmed and filtered by run_batch
    int port = 443;
    int warn_days = 15;
    int workers = 10;
    std::chrono::milliseconds timeout{5000};
    TimePoint now{};                      // clock reading used for days_left
    std::vector<int> percentiles;         // latency percentiles to report
    bool dedup = true;                    // fold repeated hosts
};

struct Progress {
    std::size_t completed{};
    std::size_t total{};
    double fraction() const
    {
        return total == 0 ? 1.0 : static_cast<double>(completed) / static_cast<double>(total);
    }
};

// Both callbacks run on worker threads, one at a time, in completion order.
// They must not call back into the running batch.
using ProgressCallback = std::function<void(const Progress&)>;
using OutcomeCallback  = std::function<void(const ProbeOutcome&)>;

// Trims surrounding whitespace, drops blank entries and, with dedup, keeps
// only the first occurrence of each host.
std::vector<std::string> normalize_hosts(const std::vector<std::string>& raw, bool dedup);

// Probes every normalized host with at most req.workers probes in flight.
// - Every dispatched host yields exactly one outcome; failures become ERROR.
// - on_outcome then on_progress fire after each outcome is recorded; the
//   last progress update has completed == total. Callbacks are serialized
//   on their own mutex, never on the one guarding the result.
// - Outcomes are returned in input order.
// - If cancel is signalled, no further probes start and a partial result
//   with cancelled = true is returned once in-flight probes finish.
// - A std::exception thrown by probe becomes that host's ERROR row
//   (ProbeErrorKind::Internal). Anything thrown by a callback, or a
//   non-std exception from probe, stops dispatch and is rethrown after all
//   workers have been joined.
BatchResult run_batch(const BatchRequest& req,
                      const ProbeFn& probe,
                      const ProgressCallback& on_progress = {},
                      const OutcomeCallback& on_outcome = {},
                      Cancellation* cancel = nullptr);

} // namespace cw
