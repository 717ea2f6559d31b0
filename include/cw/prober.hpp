#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

#include "cw/model.hpp"

namespace cw
{
// Signature of a single-host probe. The orchestrator only depends on this,
// so tests can substitute a scripted prober.
using ProbeFn = std::function<ProbeResult(const ProbeTarget &,
                                          std::chrono::milliseconds)>;

// One TLS probe against target.host:target.port.
// - timeout bounds TCP connect + TLS handshake + certificate read;
//   name resolution happens before the deadline starts.
// - Trust: system default CA store, SNI and hostname (or IP) verification
//   against target.host.
// - Never throws; failures come back as kind + error, with ms always set.
ProbeResult probe_tls_once(const ProbeTarget &target,
                           std::chrono::milliseconds timeout);

// ASN.1 UTCTime ("YYMMDDHHMMSSZ") or GeneralizedTime ("YYYYMMDDHHMMSSZ")
// text, converted the same way as a certificate's notAfter.
std::optional<TimePoint> parse_asn1_time(std::string_view text);
} // namespace cw
