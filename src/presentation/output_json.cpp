#include "cw/output.hpp"

#include <iomanip>
#include <sstream>

#include "cw/cert_time.hpp"
#include "cw/classify.hpp"
#include "cw/json.hpp"

namespace cw
{
static void write_record(std::ostringstream &os, const ProbeOutcome &o)
{
    os << "{";
    os << R"("host":)" << json_quote(o.host);
    os << R"(,"port":)" << o.port;
    os << R"(,"expiry":)";
    if (o.expiry) os << json_quote(format_timestamp(*o.expiry));
    else os << "null";
    os << R"(,"days_left":)";
    if (o.days_left) os << *o.days_left;
    else os << "null";
    os << R"(,"status":")" << status_str(o.status) << R"(")";
    os << R"(,"error":)" << json_quote(o.error);
    os << "}";
}

std::string build_ndjson_outcome(const ProbeOutcome &outcome)
{
    std::ostringstream os;
    write_record(os, outcome);
    return os.str();
}

std::string build_final_json(const BatchResult &result)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("checked_at":)" << json_quote(format_iso8601(result.checked_at)) << ",";
    os << R"("port":)" << result.port << ",";
    os << R"("warn_days":)" << result.warn_days << ",";
    os << R"("workers":)" << result.workers << ",";
    os << R"("requested":)" << result.requested << ",";
    os << R"("cancelled":)" << (result.cancelled ? "true" : "false") << ",";
    os << R"("summary":{"total":)" << result.summary.total
            << R"(,"ok":)" << result.summary.ok
            << R"(,"warning":)" << result.summary.warning
            << R"(,"error":)" << result.summary.error << "},";
    os << R"("buckets":[)";
    for (size_t i = 0; i < result.buckets.size(); ++i)
    {
        if (i) os << ",";
        os << R"({"label":)" << json_quote(bucket_label(result.buckets[i].first))
                << R"(,"count":)" << result.buckets[i].second << "}";
    }
    os << "],";
    os << R"("latency":{"min_ms":)" << result.latency.min
            << R"(,"avg_ms":)" << result.latency.avg
            << R"(,"max_ms":)" << result.latency.max;
    if (!result.latency.percentiles.empty())
    {
        os << R"(,"percentiles":{)";
        for (size_t i = 0; i < result.latency.percentiles.size(); ++i)
        {
            if (i) os << ",";
            os << R"("p)" << result.latency.percentiles[i].first << R"(":)"
                    << result.latency.percentiles[i].second;
        }
        os << "}";
    }
    os << "},";
    os << R"("results":[)";
    for (size_t i = 0; i < result.outcomes.size(); ++i)
    {
        if (i) os << ",";
        write_record(os, result.outcomes[i]);
    }
    os << "]";
    os << "}";
    return os.str();
}
} // namespace cw
