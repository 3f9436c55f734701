#pragma once

#include "quotawatch/types.hpp"

#include <string>
#include <vector>

namespace quotawatch {

// Supplies usage records stamped at or after `since`. Calls must be
// idempotent: the engine de-duplicates overlapping deliveries.
// Implementations throw SourceUnavailableException when the underlying
// data cannot be read.
class UsageSource {
public:
    virtual ~UsageSource() = default;

    virtual std::vector<UsageRecord> fetch_usage(Timestamp since) = 0;

    // Short label used in log lines
    virtual std::string name() const = 0;
};

} // namespace quotawatch
