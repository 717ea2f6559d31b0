#pragma once

#include <optional>

#include "cw/model.hpp"

namespace cw {

// ERROR when days_left is absent, WARNING when days_left <= warn_days
// (negative included), OK otherwise.
Status classify(std::optional<int> days_left, int warn_days);

Bucket bucket_for(int days_left);

const char* status_str(Status s);
const char* bucket_label(Bucket b);

// Builds the outcome for one finished probe against a fixed clock reading.
ProbeOutcome make_outcome(const ProbeTarget& target,
                          const ProbeResult& result,
                          TimePoint now,
                          int warn_days);

} // namespace cw
