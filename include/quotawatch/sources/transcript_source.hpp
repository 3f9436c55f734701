#pragma once

#include "quotawatch/rate_table.hpp"
#include "quotawatch/usage_source.hpp"

#include <filesystem>
#include <istream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace quotawatch::sources {

// Scans session transcripts (*.jsonl, recursively) under a root directory.
// Only `"type": "assistant"` entries with a usage block count; entries
// repeating a requestId are counted once. Token usage is priced with the
// RateTable and bucketed by local hour and model.
class TranscriptSource : public UsageSource {
public:
    TranscriptSource(std::filesystem::path root, RateTable rates);

    std::vector<UsageRecord> fetch_usage(Timestamp since) override;
    std::string name() const override;

    const std::filesystem::path& root() const noexcept;

    // Accumulates the assistant entries of one transcript stream into hour
    // buckets. Unparseable lines are skipped.
    class Collector {
    public:
        Collector(const RateTable& rates, Timestamp since);

        void add_stream(std::istream& in);
        void add_line(const std::string& line);

        std::vector<UsageRecord> records() const;
        std::size_t skipped_lines() const noexcept;
        std::size_t duplicate_requests() const noexcept;

    private:
        const RateTable& rates_;
        Timestamp since_;
        std::map<std::pair<Timestamp::rep, std::string>, UsageRecord> buckets_;
        std::set<std::string> seen_requests_;
        std::size_t skipped_{0};
        std::size_t duplicates_{0};
    };

private:
    std::filesystem::path root_;
    RateTable rates_;
};

} // namespace quotawatch::sources
