#include "quotawatch/calibration_store.hpp"
#include "quotawatch/exceptions.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace quotawatch {

namespace {

json cap_to_json(const Cap& cap) {
    json j;
    j["name"] = cap.name;
    j["weekly_limit_usd"] = cap.weekly_limit;
    j["model_prefix"] = cap.model_prefix;
    if (cap.reset_hour) {
        j["reset_hour"] = *cap.reset_hour;
    } else {
        j["reset_hour"] = nullptr;
    }
    return j;
}

Cap cap_from_json(const json& j) {
    Cap cap;
    cap.name = j.at("name").get<std::string>();
    cap.weekly_limit = j.at("weekly_limit_usd").get<double>();
    cap.model_prefix = j.value("model_prefix", std::string{});
    if (j.contains("reset_hour") && !j["reset_hour"].is_null()) {
        cap.reset_hour = j["reset_hour"].get<int>();
    }
    return cap;
}

} // anonymous namespace

// ========== MemoryCalibrationStore ==========

MemoryCalibrationStore::MemoryCalibrationStore(Calibration initial)
    : stored_(std::move(initial)) {}

std::optional<Calibration> MemoryCalibrationStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
}

void MemoryCalibrationStore::save(const Calibration& calibration) {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_ = calibration;
    save_count_++;
}

std::size_t MemoryCalibrationStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

// ========== JsonCalibrationStore ==========

JsonCalibrationStore::JsonCalibrationStore(std::filesystem::path path)
    : path_(std::move(path)) {}

const std::filesystem::path& JsonCalibrationStore::path() const noexcept {
    return path_;
}

std::string JsonCalibrationStore::serialize(const Calibration& calibration) {
    json j;
    j["anchor_date"] = format_date(calibration.anchor.date);
    j["reset_hour"] = calibration.anchor.reset_hour;

    json caps = json::array();
    for (auto& cap : calibration.caps) {
        caps.push_back(cap_to_json(cap));
    }
    j["caps"] = std::move(caps);

    const auto& b = calibration.baseline;
    json baseline;
    baseline["target_ratio"] = b.target_ratio;
    baseline["floor_ratio"] = b.floor_ratio;
    baseline["plan_monthly_usd"] = b.plan_monthly_cost;
    baseline["weekly_spend_usd"] = b.weekly_spend_baseline;
    if (b.daily_spend_baseline) {
        baseline["daily_spend_usd"] = *b.daily_spend_baseline;
    }
    j["baseline"] = std::move(baseline);

    j["calibrated_date"] = calibration.calibrated_on;
    j["note"] = calibration.note;
    return j.dump(2);
}

Calibration JsonCalibrationStore::deserialize(const std::string& text) {
    Calibration c;
    try {
        json j = json::parse(text);

        auto anchor = parse_date(j.at("anchor_date").get<std::string>());
        if (!anchor) {
            throw CalibrationStoreException("anchor_date is not a YYYY-MM-DD date");
        }
        c.anchor.date = *anchor;
        c.anchor.reset_hour = j.value("reset_hour", 0);

        for (auto& cj : j.at("caps")) {
            c.caps.push_back(cap_from_json(cj));
        }

        if (j.contains("baseline")) {
            const json& bj = j["baseline"];
            c.baseline.target_ratio = bj.value("target_ratio", c.baseline.target_ratio);
            c.baseline.floor_ratio = bj.value("floor_ratio", c.baseline.floor_ratio);
            c.baseline.plan_monthly_cost = bj.value("plan_monthly_usd", c.baseline.plan_monthly_cost);
            c.baseline.weekly_spend_baseline =
                bj.value("weekly_spend_usd", c.baseline.weekly_spend_baseline);
            if (bj.contains("daily_spend_usd") && !bj["daily_spend_usd"].is_null()) {
                c.baseline.daily_spend_baseline = bj["daily_spend_usd"].get<double>();
            }
        }

        c.calibrated_on = j.value("calibrated_date", std::string{});
        c.note = j.value("note", std::string{});
    } catch (const json::exception& e) {
        throw CalibrationStoreException(std::string("malformed calibration record: ") + e.what());
    }
    return c;
}

std::optional<Calibration> JsonCalibrationStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw CalibrationStoreException("cannot open " + path_.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return deserialize(buffer.str());
}

void JsonCalibrationStore::save(const Calibration& calibration) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw CalibrationStoreException("cannot create " + path_.parent_path().string() +
                                            ": " + ec.message());
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw CalibrationStoreException("cannot write " + tmp.string());
        }
        out << serialize(calibration) << "\n";
        if (!out.good()) {
            throw CalibrationStoreException("short write to " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        throw CalibrationStoreException("cannot replace " + path_.string() + ": " + ec.message());
    }
}

} // namespace quotawatch
