#pragma once

#include "quotawatch/usage_source.hpp"

#include <memory>
#include <string>
#include <vector>

namespace quotawatch::sources {

// Merges several sources by precedence. Sources are consulted in the order
// they were added; a later source only contributes records for calendar
// days that no earlier source covered. The exception is hour-resolution
// records for a day covered only by day-resolution records: those are kept
// as detail_only so the hourly view still has data. A failing source is
// skipped as long as at least one source answers.
class CompositeSource : public UsageSource {
public:
    void add_source(std::shared_ptr<UsageSource> source);

    std::vector<UsageRecord> fetch_usage(Timestamp since) override;
    std::string name() const override;

    std::size_t size() const noexcept;

private:
    std::vector<std::shared_ptr<UsageSource>> sources_;
};

} // namespace quotawatch::sources
