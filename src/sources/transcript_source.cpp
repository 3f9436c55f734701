#include "quotawatch/sources/transcript_source.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace quotawatch::sources {

namespace {

std::string normalize_model(std::string model) {
    if (model.rfind("claude-", 0) != 0) {
        model = "claude-" + model;
    }
    return model;
}

// Returns the member as an object, or an empty object when absent
const json& object_member(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

std::string string_member(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

TokenCount count_member(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return it->get<TokenCount>();
}

} // anonymous namespace

// ========== Collector ==========

TranscriptSource::Collector::Collector(const RateTable& rates, Timestamp since)
    : rates_(rates), since_(since) {}

void TranscriptSource::Collector::add_stream(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        add_line(line);
    }
}

void TranscriptSource::Collector::add_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    json obj = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (obj.is_discarded() || !obj.is_object()) {
        skipped_++;
        return;
    }
    if (string_member(obj, "type") != "assistant") return;

    std::string ts = string_member(obj, "timestamp");
    if (ts.empty()) ts = string_member(obj, "created_at");
    auto instant = parse_iso8601(ts);
    if (!instant) {
        skipped_++;
        return;
    }
    Timestamp local = from_system(*instant);
    if (local < since_) return;

    std::string request_id = string_member(obj, "requestId");
    if (!request_id.empty()) {
        if (!seen_requests_.insert(request_id).second) {
            duplicates_++;
            return;
        }
    }

    const json& message = object_member(obj, "message");
    const json* usage = &object_member(message, "usage");
    if (usage->empty()) usage = &object_member(obj, "usage");
    if (usage->empty()) return;

    std::string model = string_member(message, "model");
    if (model.empty()) model = string_member(obj, "model");
    if (model.empty()) model = "unknown";
    model = normalize_model(std::move(model));

    TokenCounts tokens;
    tokens.input = count_member(*usage, "input_tokens");
    tokens.output = count_member(*usage, "output_tokens");
    tokens.cache_write = count_member(*usage, "cache_creation_input_tokens");
    tokens.cache_read = count_member(*usage, "cache_read_input_tokens");

    Timestamp hour = start_of_hour(local);
    auto key = std::make_pair(hour.time_since_epoch().count(), model);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        UsageRecord r;
        r.timestamp = hour;
        r.model = model;
        r.cost = 0.0;
        it = buckets_.emplace(std::move(key), std::move(r)).first;
    }
    it->second.tokens += tokens;
    it->second.cost = *it->second.cost + rates_.cost_of(model, tokens);
}

std::vector<UsageRecord> TranscriptSource::Collector::records() const {
    std::vector<UsageRecord> out;
    out.reserve(buckets_.size());
    for (auto& [key, record] : buckets_) {
        out.push_back(record);
    }
    return out;
}

std::size_t TranscriptSource::Collector::skipped_lines() const noexcept { return skipped_; }
std::size_t TranscriptSource::Collector::duplicate_requests() const noexcept { return duplicates_; }

// ========== TranscriptSource ==========

TranscriptSource::TranscriptSource(std::filesystem::path root, RateTable rates)
    : root_(std::move(root)), rates_(std::move(rates)) {}

const std::filesystem::path& TranscriptSource::root() const noexcept {
    return root_;
}

std::string TranscriptSource::name() const {
    return "transcripts:" + root_.string();
}

std::vector<UsageRecord> TranscriptSource::fetch_usage(Timestamp since) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        throw SourceUnavailableException("transcript directory not found: " + root_.string());
    }

    std::vector<std::filesystem::path> files;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    for (std::filesystem::recursive_directory_iterator it(root_, options, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".jsonl") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw SourceUnavailableException("cannot scan " + root_.string() + ": " + ec.message());
    }

    // Directory order is unspecified; request-id dedup must not depend on it
    std::sort(files.begin(), files.end());

    Collector collector(rates_, since);
    for (auto& path : files) {
        std::ifstream in(path);
        if (!in.is_open()) continue;   // rotated away between scan and open
        collector.add_stream(in);
    }
    return collector.records();
}

} // namespace quotawatch::sources
