#include "cw/batch_cache.hpp"

#include <algorithm>

#include "cw/log.hpp"

namespace cw {

BatchKey make_batch_key(const BatchRequest& req)
{
    BatchKey key{};
    key.hosts = normalize_hosts(req.hosts, req.dedup);
    std::ranges::sort(key.hosts);
    key.port = req.port;
    key.warn_days = req.warn_days;
    key.workers = req.workers;
    key.percentiles = req.percentiles;
    return key;
}

std::optional<BatchResult> BatchCache::find(const BatchKey& key) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void BatchCache::store(const BatchKey& key, BatchResult result)
{
    std::lock_guard<std::mutex> lk(mtx_);
    entries_.insert_or_assign(key, std::move(result));
}

bool BatchCache::invalidate(const BatchKey& key)
{
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.erase(key) > 0;
}

void BatchCache::clear()
{
    std::lock_guard<std::mutex> lk(mtx_);
    entries_.clear();
}

std::size_t BatchCache::size() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

BatchResult run_batch_cached(BatchCache& cache,
                             const BatchRequest& req,
                             const ProbeFn& probe,
                             const ProgressCallback& on_progress,
                             const OutcomeCallback& on_outcome,
                             Cancellation* cancel)
{
    BatchKey key = make_batch_key(req);
    if (auto hit = cache.find(key))
    {
        log_debug("batch cache hit for " + std::to_string(key.hosts.size()) + " host(s)");
        return *hit;
    }

    BatchResult result = run_batch(req, probe, on_progress, on_outcome, cancel);
    if (!result.cancelled) cache.store(key, result);
    return result;
}

} // namespace cw
