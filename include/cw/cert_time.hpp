#pragma once

#include <string>

#include "cw/model.hpp"

namespace cw {

// "YYYY-MM-DD HH:MM:SS" in UTC
std::string format_timestamp(TimePoint tp);

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
std::string format_iso8601(TimePoint tp);

// Whole days from now until expiry, floored toward negative infinity:
// 1s before expiry is 0, 1s after expiry is -1.
int days_between(TimePoint expiry, TimePoint now);

} // namespace cw
