#include "cw/classify.hpp"

#include "cw/cert_time.hpp"

namespace cw {

Status classify(std::optional<int> days_left, int warn_days)
{
    if (!days_left) return Status::Error;
    return *days_left <= warn_days ? Status::Warning : Status::Ok;
}

Bucket bucket_for(int days_left)
{
    if (days_left <= 0) return Bucket::Expired;
    if (days_left <= 7) return Bucket::Week;
    if (days_left <= 30) return Bucket::Month;
    if (days_left <= 90) return Bucket::Quarter;
    if (days_left <= 365) return Bucket::Year;
    return Bucket::Beyond;
}

const char* status_str(Status s)
{
    switch (s)
    {
        case Status::Ok: return "OK";
        case Status::Warning: return "WARNING";
        case Status::Error: return "ERROR";
    }
    return "ERROR";
}

const char* bucket_label(Bucket b)
{
    switch (b)
    {
        case Bucket::Expired: return "Expired";
        case Bucket::Week: return "0-7 days";
        case Bucket::Month: return "8-30 days";
        case Bucket::Quarter: return "31-90 days";
        case Bucket::Year: return "91-365 days";
        case Bucket::Beyond: return ">365 days";
    }
    return "?";
}

ProbeOutcome make_outcome(const ProbeTarget& target,
                          const ProbeResult& result,
                          TimePoint now,
                          int warn_days)
{
    ProbeOutcome out{};
    out.host = target.host;
    out.port = target.port;
    out.index = target.index;
    out.ms = result.ms;

    if (result.kind != ProbeErrorKind::None || !result.expiry)
    {
        out.status = Status::Error;
        out.error_kind = result.kind == ProbeErrorKind::None
                             ? ProbeErrorKind::CertificateParse
                             : result.kind;
        out.error = result.error.empty() ? std::string("no expiry returned") : result.error;
        return out;
    }

    out.expiry = result.expiry;
    out.days_left = days_between(*result.expiry, now);
    out.status = classify(out.days_left, warn_days);
    return out;
}

} // namespace cw
