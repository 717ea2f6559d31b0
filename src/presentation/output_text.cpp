#include "cw/output.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "cw/cert_time.hpp"
#include "cw/classify.hpp"
#include "cw/usecases.hpp"

namespace cw {

std::string expiry_display(const std::optional<TimePoint>& expiry)
{
    return expiry ? format_timestamp(*expiry) : std::string("-");
}

std::string format_header_text(const BatchResult& result)
{
    std::ostringstream os;
    os << "Checked: " << result.requested << " host(s)"
       << "  Port: " << result.port
       << "  Warn: <= " << result.warn_days << " day(s)"
       << "  Workers: " << result.workers << '\n';
    os << "Clock: " << format_iso8601(result.checked_at) << '\n';
    if (result.cancelled)
    {
        os << "Cancelled: " << result.outcomes.size() << " of "
           << result.requested << " host(s) completed\n";
    }
    return os.str();
}

std::string format_results_text(const BatchResult& result)
{
    size_t host_w = 4;
    for (const auto& o : result.outcomes) host_w = std::max(host_w, o.host.size());

    std::ostringstream os;
    os << std::left
       << std::setw(static_cast<int>(host_w)) << "HOST" << "  "
       << std::setw(5) << "PORT" << "  "
       << std::setw(19) << "EXPIRY" << "  "
       << std::right << std::setw(6) << "DAYS" << "  "
       << std::left << std::setw(7) << "STATUS" << "  "
       << "ERROR" << '\n';
    for (const auto& o : result.outcomes)
    {
        os << std::left
           << std::setw(static_cast<int>(host_w)) << o.host << "  "
           << std::setw(5) << o.port << "  "
           << std::setw(19) << expiry_display(o.expiry) << "  "
           << std::right << std::setw(6)
           << (o.days_left ? std::to_string(*o.days_left) : std::string("-")) << "  "
           << std::left << std::setw(7) << status_str(o.status);
        if (!o.error.empty()) os << "  " << o.error;
        os << '\n';
    }
    return os.str();
}

std::string format_summary_text(const Summary& summary)
{
    std::ostringstream os;
    os << "summary: total=" << summary.total
       << " ok=" << summary.ok
       << " warning=" << summary.warning
       << " error=" << summary.error << '\n';
    return os.str();
}

std::string format_buckets_text(const BucketHistogram& buckets, int width)
{
    size_t peak = 0;
    for (const auto& [b, n] : buckets) peak = std::max(peak, n);

    std::ostringstream os;
    os << "expiry buckets:\n";
    for (const auto& [b, n] : buckets)
    {
        int bar = 0;
        if (peak > 0 && width > 0)
        {
            bar = static_cast<int>(std::lround(static_cast<double>(n) * width /
                                               static_cast<double>(peak)));
            if (n > 0 && bar == 0) bar = 1;
        }
        os << "  " << std::left << std::setw(12) << bucket_label(b)
           << std::right << std::setw(4) << n << ' '
           << std::string(static_cast<size_t>(bar), '#') << '\n';
    }
    return os.str();
}

std::string format_latency_text(const Aggregation& latency, size_t count)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "latency: min=" << latency.min
       << " ms, avg=" << latency.avg
       << " ms, max=" << latency.max
       << " ms (" << count << " probes)\n";
    if (!latency.percentiles.empty())
    {
        os << "percentiles: ";
        for (size_t i = 0; i < latency.percentiles.size(); ++i)
        {
            if (i) os << ", ";
            os << 'p' << latency.percentiles[i].first << '=' << latency.percentiles[i].second;
        }
        os << '\n';
    }
    return os.str();
}

std::string format_progress_text(const Progress& progress, int width)
{
    const double f = std::clamp(progress.fraction(), 0.0, 1.0);
    const int filled = static_cast<int>(std::floor(f * width));
    std::ostringstream os;
    os << "\r[" << std::string(static_cast<size_t>(filled), '#')
       << std::string(static_cast<size_t>(width - filled), ' ') << "] "
       << progress.completed << '/' << progress.total
       << " (" << static_cast<int>(std::floor(f * 100.0)) << "%)";
    return os.str();
}

} // namespace cw
