#pragma once

#include "quotawatch/types.hpp"
#include <stdexcept>
#include <string>

namespace quotawatch {

class QuotaWatchException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The usage source could not be reached, timed out, or returned malformed
// data. The previous snapshot stays authoritative; retry on the next cycle.
class SourceUnavailableException : public QuotaWatchException {
public:
    explicit SourceUnavailableException(const std::string& reason, bool timed_out = false)
        : QuotaWatchException("Usage source unavailable: " + reason)
        , timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }
    bool retryable() const noexcept { return true; }

private:
    bool timed_out_;
};

// A calibration write failed validation and was not persisted
class InvalidCalibrationException : public QuotaWatchException {
public:
    explicit InvalidCalibrationException(const std::string& reason)
        : QuotaWatchException("Invalid calibration: " + reason) {}
};

class CalibrationStoreException : public QuotaWatchException {
public:
    using QuotaWatchException::QuotaWatchException;
};

class UnknownCapException : public QuotaWatchException {
public:
    explicit UnknownCapException(const std::string& cap_name)
        : QuotaWatchException("Cap not found: " + cap_name)
        , cap_name_(cap_name) {}

    const std::string& cap_name() const noexcept { return cap_name_; }

private:
    std::string cap_name_;
};

} // namespace quotawatch
