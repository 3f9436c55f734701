#pragma once

#include "quotawatch/types.hpp"

#include <string>
#include <unordered_map>

namespace quotawatch {

// USD per million tokens
struct ModelRates {
    double input{0.0};
    double output{0.0};
    double cache_write{0.0};
    double cache_read{0.0};
};

// Converts token counts into cost for sources that do not price usage
// themselves. Read-only once handed to an Engine.
class RateTable {
public:
    explicit RateTable(ModelRates default_rates = ModelRates{3.00, 15.00, 3.75, 0.30});

    // Published per-model prices for the Claude families
    static RateTable builtin();

    void set_rates(std::string model, ModelRates rates);

    // Exact match, then the longest registered prefix, then the default.
    const ModelRates& rates_for(const std::string& model) const;
    double cost_of(const std::string& model, const TokenCounts& tokens) const;

    const ModelRates& default_rates() const noexcept;
    std::size_t size() const noexcept;

private:
    ModelRates default_rates_;
    std::unordered_map<std::string, ModelRates> rates_;
};

} // namespace quotawatch
