#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

using namespace quotawatch;

TEST(RateTableTest, BuiltinCarriesPublishedPrices) {
    RateTable rates = RateTable::builtin();

    EXPECT_DOUBLE_EQ(rates.rates_for("claude-sonnet-4-6").output, 15.00);
    EXPECT_DOUBLE_EQ(rates.rates_for("claude-opus-4-6").input, 15.00);
    EXPECT_DOUBLE_EQ(rates.rates_for("claude-haiku-4-5").cache_read, 0.08);
}

TEST(RateTableTest, DatedVariantFallsBackToFamily) {
    RateTable rates = RateTable::builtin();
    EXPECT_DOUBLE_EQ(rates.rates_for("claude-haiku-4-5-20251001").input, 0.80);
}

TEST(RateTableTest, UnknownModelUsesDefault) {
    RateTable rates = RateTable::builtin();
    const ModelRates& r = rates.rates_for("gpt-something");
    EXPECT_DOUBLE_EQ(r.input, 3.00);
    EXPECT_DOUBLE_EQ(r.output, 15.00);
}

TEST(RateTableTest, LongestPrefixWins) {
    RateTable rates(ModelRates{1, 1, 1, 1});
    rates.set_rates("claude-x", ModelRates{2, 2, 2, 2});
    rates.set_rates("claude-x-pro", ModelRates{5, 5, 5, 5});

    EXPECT_DOUBLE_EQ(rates.rates_for("claude-x-pro-2").input, 5.0);
    EXPECT_DOUBLE_EQ(rates.rates_for("claude-x-2").input, 2.0);
    EXPECT_DOUBLE_EQ(rates.rates_for("claude-y").input, 1.0);
    EXPECT_EQ(rates.size(), 2u);
}

TEST(RateTableTest, CostIsPerMillionTokens) {
    RateTable rates = RateTable::builtin();
    TokenCounts t;
    t.input = 1'000'000;
    t.output = 1'000'000;
    t.cache_write = 2'000'000;
    t.cache_read = 10'000'000;

    // 3 + 15 + 7.5 + 3
    EXPECT_NEAR(rates.cost_of("claude-sonnet-4-6", t), 28.5, 1e-9);
    EXPECT_DOUBLE_EQ(rates.cost_of("claude-sonnet-4-6", TokenCounts{}), 0.0);
}
