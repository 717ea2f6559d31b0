#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cw/model.hpp"
#include "cw/usecases.hpp"

namespace cw {

struct BatchKey {
    std::vector<std::string> hosts;   // normalized, sorted
    int port{};
    int warn_days{};
    int workers{};
    std::vector<int> percentiles;     // as requested; order matters

    auto operator<=>(const BatchKey&) const = default;
};

BatchKey make_batch_key(const BatchRequest& req);

// Results of earlier batches, keyed by their parameters. Owned by the
// caller, which decides when entries go stale; run_batch never consults it.
class BatchCache {
public:
    std::optional<BatchResult> find(const BatchKey& key) const;
    void store(const BatchKey& key, BatchResult result);
    bool invalidate(const BatchKey& key);
    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<BatchKey, BatchResult> entries_;
};

// Returns the cached result for req when present (no probes, no callbacks),
// otherwise runs the batch and stores it. Cancelled runs are not stored.
BatchResult run_batch_cached(BatchCache& cache,
                             const BatchRequest& req,
                             const ProbeFn& probe,
                             const ProgressCallback& on_progress = {},
                             const OutcomeCallback& on_outcome = {},
                             Cancellation* cancel = nullptr);

} // namespace cw
