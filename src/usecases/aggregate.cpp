#include "cw/aggregate.hpp"

#include <algorithm>

#include "cw/classify.hpp"

namespace cw {

Summary summarize(const std::vector<ProbeOutcome>& outcomes)
{
    Summary s{};
    s.total = outcomes.size();
    for (const auto& o : outcomes)
    {
        switch (o.status)
        {
            case Status::Ok: ++s.ok; break;
            case Status::Warning: ++s.warning; break;
            case Status::Error: ++s.error; break;
        }
    }
    return s;
}

BucketHistogram bucket_histogram(const std::vector<ProbeOutcome>& outcomes)
{
    BucketHistogram h{};
    for (size_t i = 0; i < kBucketCount; ++i)
    {
        h[i] = {static_cast<Bucket>(i), 0};
    }
    for (const auto& o : outcomes)
    {
        if (!o.days_left) continue;
        ++h[static_cast<size_t>(bucket_for(*o.days_left))].second;
    }
    return h;
}

namespace {

// Nearest-rank percentile over an ascending, non-empty sample: the smallest
// value with at least p% of the sample at or below it. p=0 is the minimum.
double nearest_rank(const std::vector<double>& ascending, int p)
{
    const std::size_t n = ascending.size();
    const std::size_t pc = static_cast<std::size_t>(std::clamp(p, 0, 100));
    const std::size_t rank = std::max<std::size_t>(1, (pc * n + 99) / 100);
    return ascending[std::min(rank, n) - 1];
}

} // namespace

Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl)
{
    Aggregation ag{};
    if (times.empty()) return ag;

    std::vector<double> ascending(times);
    std::ranges::sort(ascending);

    double sum = 0.0;
    for (double t : ascending) sum += t;

    ag.min = ascending.front();
    ag.max = ascending.back();
    ag.avg = sum / static_cast<double>(ascending.size());
    for (int p : pctl) ag.percentiles.emplace_back(p, nearest_rank(ascending, p));
    return ag;
}

} // namespace cw
