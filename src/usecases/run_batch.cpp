#include "cw/usecases.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <string_view>
#include <unordered_set>

#include "cw/aggregate.hpp"
#include "cw/classify.hpp"
#include "cw/log.hpp"

namespace cw {

namespace {

constexpr std::string_view kSpace = " \t\r\n\v\f";

std::string trim(const std::string& s)
{
    const auto b = s.find_first_not_of(kSpace);
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(kSpace);
    return s.substr(b, e - b + 1);
}

void finalize(BatchResult& result, const std::vector<int>& pctl)
{
    std::ranges::sort(result.outcomes, {}, &ProbeOutcome::index);
    result.summary = summarize(result.outcomes);
    result.buckets = bucket_histogram(result.outcomes);

    std::vector<double> times;
    times.reserve(result.outcomes.size());
    for (const auto& o : result.outcomes) times.push_back(o.ms);
    result.latency = aggregate_times(times, pctl);
}

} // namespace

std::vector<std::string> normalize_hosts(const std::vector<std::string>& raw, bool dedup)
{
    std::vector<std::string> out;
    out.reserve(raw.size());
    std::unordered_set<std::string> seen;
    for (const auto& h : raw)
    {
        std::string t = trim(h);
        if (t.empty()) continue;
        if (dedup && !seen.insert(t).second) continue;
        out.push_back(std::move(t));
    }
    return out;
}

BatchResult run_batch(const BatchRequest& req,
                      const ProbeFn& probe,
                      const ProgressCallback& on_progress,
                      const OutcomeCallback& on_outcome,
                      Cancellation* cancel)
{
    const std::vector<std::string> hosts = normalize_hosts(req.hosts, req.dedup);

    BatchResult result{};
    result.requested = hosts.size();
    result.checked_at = req.now;
    result.port = req.port;
    result.warn_days = req.warn_days;
    result.workers = req.workers;

    if (hosts.empty())
    {
        finalize(result, req.percentiles);
        return result;
    }

    const std::size_t total = hosts.size();
    const int workers = static_cast<int>(
        std::min<std::size_t>(static_cast<std::size_t>(std::max(req.workers, 1)), total));
    log_info("checking " + std::to_string(total) + " host(s) on port " +
             std::to_string(req.port) + " with " + std::to_string(workers) + " worker(s)");

    result.outcomes.reserve(total);
    std::mutex mtx;          // result.outcomes
    std::mutex delivery_mtx; // on_outcome, on_progress, delivered
    std::size_t delivered = 0;
    std::exception_ptr failure;

    {
        ThreadPool pool(workers);
        for (std::size_t i = 0; i < total; ++i)
        {
            ProbeTarget target{hosts[i], req.port, i};
            pool.submit_cancelable(
                [&, target = std::move(target)](const std::atomic<bool>& stop)
                {
                    if (stop.load(std::memory_order_relaxed)) return;
                    if (cancel && cancel->is_cancelled()) return;

                    ProbeResult pr{};
                    try
                    {
                        pr = probe(target, req.timeout);
                    }
                    catch (const std::exception& e)
                    {
                        pr = ProbeResult{};
                        pr.kind = ProbeErrorKind::Internal;
                        pr.error = std::string("internal error: ") + e.what();
                        log_warn(target.host + ": prober threw: " + e.what());
                    }
                    ProbeOutcome outcome = make_outcome(target, pr, req.now, req.warn_days);
                    if (outcome.status == Status::Error)
                    {
                        log_debug(target.host + ": " + outcome.error);
                    }
                    else
                    {
                        log_debug(target.host + ": " + std::to_string(*outcome.days_left) +
                                  " day(s) left, " + status_str(outcome.status));
                    }

                    {
                        std::lock_guard<std::mutex> lk(mtx);
                        result.outcomes.push_back(outcome);
                    }
                    // Callbacks never overlap and see delivered counts in
                    // order; recording above never waits on them.
                    std::lock_guard<std::mutex> lk(delivery_mtx);
                    ++delivered;
                    if (on_outcome) on_outcome(outcome);
                    if (on_progress) on_progress(Progress{delivered, total});
                });
        }
        pool.wait_idle();
        failure = pool.first_exception();
    } // workers joined here

    if (failure) std::rethrow_exception(failure);

    result.cancelled = result.outcomes.size() < total;
    if (result.cancelled)
    {
        log_warn("batch cancelled after " + std::to_string(result.outcomes.size()) +
                 " of " + std::to_string(total) + " host(s)");
    }

    finalize(result, req.percentiles);
    log_info("done: " + std::to_string(result.summary.ok) + " ok, " +
             std::to_string(result.summary.warning) + " warning, " +
             std::to_string(result.summary.error) + " error");
    return result;
}

} // namespace cw
