#pragma once

#include "quotawatch/calibration.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace quotawatch {

// Persistence for the calibration record. The engine treats the format as
// opaque; nullopt from load() means no calibration was ever saved.
class CalibrationStore {
public:
    virtual ~CalibrationStore() = default;

    virtual std::optional<Calibration> load() = 0;
    virtual void save(const Calibration& calibration) = 0;
};

class MemoryCalibrationStore : public CalibrationStore {
public:
    MemoryCalibrationStore() = default;
    explicit MemoryCalibrationStore(Calibration initial);

    std::optional<Calibration> load() override;
    void save(const Calibration& calibration) override;

    std::size_t save_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<Calibration> stored_;
    std::size_t save_count_{0};
};

// JSON file store. Writes go to a sibling temp file that is renamed over
// the target so readers never observe a half-written record.
class JsonCalibrationStore : public CalibrationStore {
public:
    explicit JsonCalibrationStore(std::filesystem::path path);

    std::optional<Calibration> load() override;
    void save(const Calibration& calibration) override;

    const std::filesystem::path& path() const noexcept;

    static std::string serialize(const Calibration& calibration);
    static Calibration deserialize(const std::string& text);

private:
    std::filesystem::path path_;
};

} // namespace quotawatch
