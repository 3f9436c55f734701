#include "quotawatch/rate_table.hpp"

namespace quotawatch {

RateTable::RateTable(ModelRates default_rates)
    : default_rates_(default_rates) {}

RateTable RateTable::builtin() {
    RateTable table;
    const ModelRates sonnet{3.00, 15.00, 3.75, 0.30};
    const ModelRates haiku{0.80, 4.00, 1.00, 0.08};
    const ModelRates opus{15.00, 75.00, 18.75, 1.50};

    table.set_rates("claude-sonnet-4-6", sonnet);
    table.set_rates("claude-sonnet-4-5", sonnet);
    table.set_rates("claude-haiku-4-5", haiku);
    table.set_rates("claude-opus-4-6", opus);
    return table;
}

void RateTable::set_rates(std::string model, ModelRates rates) {
    rates_[std::move(model)] = rates;
}

const ModelRates& RateTable::rates_for(const std::string& model) const {
    auto it = rates_.find(model);
    if (it != rates_.end()) return it->second;

    // Dated variants (claude-haiku-4-5-20251001) fall back to their family
    const ModelRates* best = nullptr;
    std::size_t best_len = 0;
    for (auto& [name, rates] : rates_) {
        if (name.size() > best_len && model.compare(0, name.size(), name) == 0) {
            best = &rates;
            best_len = name.size();
        }
    }
    return best ? *best : default_rates_;
}

double RateTable::cost_of(const std::string& model, const TokenCounts& tokens) const {
    const ModelRates& r = rates_for(model);
    return (static_cast<double>(tokens.input)       * r.input +
            static_cast<double>(tokens.output)      * r.output +
            static_cast<double>(tokens.cache_write) * r.cache_write +
            static_cast<double>(tokens.cache_read)  * r.cache_read) / 1'000'000.0;
}

const ModelRates& RateTable::default_rates() const noexcept { return default_rates_; }
std::size_t RateTable::size() const noexcept { return rates_.size(); }

} // namespace quotawatch
