#include "quotawatch/sources/composite_source.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <set>

namespace quotawatch::sources {

void CompositeSource::add_source(std::shared_ptr<UsageSource> source) {
    sources_.push_back(std::move(source));
}

std::size_t CompositeSource::size() const noexcept {
    return sources_.size();
}

std::string CompositeSource::name() const {
    std::string out = "composite[";
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        if (i > 0) out += ",";
        out += sources_[i]->name();
    }
    return out + "]";
}

std::vector<UsageRecord> CompositeSource::fetch_usage(Timestamp since) {
    if (sources_.empty()) {
        throw SourceUnavailableException("no sources configured");
    }

    std::vector<UsageRecord> merged;
    std::set<Timestamp::rep> covered_days;
    std::set<Timestamp::rep> hourly_days;   // days with hour-resolution records
    std::string failures;
    std::size_t answered = 0;

    for (auto& source : sources_) {
        std::vector<UsageRecord> records;
        try {
            records = source->fetch_usage(since);
        } catch (const SourceUnavailableException& e) {
            if (!failures.empty()) failures += "; ";
            failures += source->name() + ": " + e.what();
            continue;
        }
        answered++;

        std::set<Timestamp::rep> days;
        std::set<Timestamp::rep> hours;
        for (auto& r : records) {
            Timestamp::rep day = start_of_day(r.timestamp).time_since_epoch().count();
            bool hourly = r.resolution == Resolution::Hour;
            if (covered_days.count(day)) {
                // Only known as a daily total so far: keep the hour detail
                if (!hourly || hourly_days.count(day)) continue;
                r.detail_only = true;
            } else {
                days.insert(day);
            }
            if (hourly) hours.insert(day);
            merged.push_back(std::move(r));
        }
        covered_days.insert(days.begin(), days.end());
        hourly_days.insert(hours.begin(), hours.end());
    }

    if (answered == 0) {
        throw SourceUnavailableException("all sources failed: " + failures);
    }
    return merged;
}

} // namespace quotawatch::sources
