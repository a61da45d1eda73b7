#include <gtest/gtest.h>
#include "oracle/oracle_fusion.hpp"

using namespace dnmm;

namespace {

uint256 usd(uint64_t cents) { return kWad * cents / 100; }

OracleSample sample(uint64_t cents, uint64_t age = 0, Bps conf = 0) {
    return OracleSample{.mid = usd(cents), .conf_bps = conf, .age_sec = age};
}

} // namespace

class OracleFusionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.max_age_sec = 48;
        config.secondary_max_age_sec = 60;
        config.secondary_max_age_sec_strict = 15;
        config.conf_cap_bps_spot = 100;
        config.conf_cap_bps_strict = 80;
        config.sigma_ewma_lambda_bps = 9'000;
        fusion = std::make_unique<OracleFusion>(config, flags);
    }

    Result<FusionOutcome> fuse(const OracleReadings& r, OracleMode mode = OracleMode::Spot) {
        return fusion->fuse(r, mode, OracleState{}, 1);
    }

    OracleConfig config;
    FeatureFlags flags;
    std::unique_ptr<OracleFusion> fusion;
};

TEST_F(OracleFusionTest, FreshPrimaryIsUsed) {
    OracleReadings r{.primary = sample(2'500, 5), .secondary = sample(2'500, 5, 20)};

    auto out = fuse(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->quote.mid_used, usd(2'500));
    EXPECT_EQ(out->quote.source_reason, SourceReason::Primary);
    EXPECT_FALSE(out->quote.used_fallback);
    EXPECT_TRUE(out->quote.divergence_checkable);
    EXPECT_EQ(out->quote.delta_bps, 0u);
}

TEST_F(OracleFusionTest, StalePrimaryFallsBackToEma) {
    OracleReadings r{
        .primary     = sample(2'500, 60),
        .primary_ema = sample(2'490, 10),
        .secondary   = sample(2'500, 5),
    };

    auto out = fuse(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->quote.source_reason, SourceReason::EmaFallback);
    EXPECT_TRUE(out->quote.used_fallback);
    EXPECT_EQ(out->quote.mid_used, usd(2'490));
}

TEST_F(OracleFusionTest, SecondaryFallbackWhenEmaDisallowed) {
    config.allow_ema_fallback = false;
    fusion = std::make_unique<OracleFusion>(config, flags);

    OracleReadings r{
        .primary     = sample(2'500, 60),
        .primary_ema = sample(2'490, 10),
        .secondary   = sample(2'510, 5),
    };

    auto out = fuse(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->quote.source_reason, SourceReason::SecondaryFallback);
    EXPECT_TRUE(out->quote.used_fallback);
    EXPECT_EQ(out->quote.mid_used, usd(2'510));
    // Nothing left to compare the secondary against
    EXPECT_FALSE(out->quote.divergence_checkable);
}

TEST_F(OracleFusionTest, NoUsableSourceIsStaleWhenAMidExists) {
    OracleReadings r{.primary = sample(2'500, 60), .secondary = sample(2'500, 100)};

    auto out = fuse(r);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error(), ErrorCode::OracleStale);
}

TEST_F(OracleFusionTest, NoMidAnywhereIsMidUnset) {
    OracleReadings r{.primary = OracleSample{}};

    auto out = fuse(r);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error(), ErrorCode::MidUnset);
}

TEST_F(OracleFusionTest, SourceErrorsFailClosed) {
    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'500)};
    r.primary.status = OracleStatus::Error;
    EXPECT_EQ(fuse(r).error(), ErrorCode::OracleReadFailed);

    r.primary.status = OracleStatus::Ok;
    r.secondary->status = OracleStatus::Error;
    EXPECT_EQ(fuse(r).error(), ErrorCode::OracleReadFailed);

    // A failing EMA only matters once the primary is stale
    r.secondary->status = OracleStatus::Ok;
    r.primary_ema = sample(2'500);
    r.primary_ema->status = OracleStatus::Error;
    EXPECT_TRUE(fuse(r));
    r.primary.age_sec = 100;
    EXPECT_EQ(fuse(r).error(), ErrorCode::OracleReadFailed);
}

TEST_F(OracleFusionTest, DeltaIsRelativeToTheLowerMid) {
    EXPECT_EQ(OracleFusion::delta_bps(usd(10'000), usd(10'100)), 100u);
    EXPECT_EQ(OracleFusion::delta_bps(usd(10'100), usd(10'000)), 100u);
    // |25.00 - 25.10| / 25.00
    EXPECT_EQ(OracleFusion::delta_bps(usd(2'500), usd(2'510)), 40u);
}

TEST_F(OracleFusionTest, ConfidenceIsTheMaxOfComponents) {
    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'500, 0, 20)};
    r.primary.bid = usd(2'499);
    r.primary.ask = usd(2'501);

    auto out = fuse(r);
    ASSERT_TRUE(out);
    // spread = 0.02 / 25.00 = 8 bps
    EXPECT_TRUE(out->quote.has_spread);
    EXPECT_EQ(out->quote.spread_bps, 8u);
    // max(8, sigma 0, secondary 20), not 28
    EXPECT_EQ(out->quote.conf_bps, 20u);
}

TEST_F(OracleFusionTest, BlendOffUsesSourceNativeConfidence) {
    flags.blend_on = false;
    fusion = std::make_unique<OracleFusion>(config, flags);

    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'500, 0, 20)};
    r.primary.bid = usd(2'499);
    r.primary.ask = usd(2'501);

    auto out = fuse(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->quote.conf_bps, 8u);
}

TEST_F(OracleFusionTest, ComponentWeightsScaleConfidence) {
    config.conf_weight_secondary_bps = 5'000;
    fusion = std::make_unique<OracleFusion>(config, flags);

    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'500, 0, 60)};
    auto out = fuse(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->quote.conf_bps, 30u);
}

TEST_F(OracleFusionTest, SpotCapsAndStrictRejects) {
    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'500, 0, 300)};

    auto spot = fuse(r, OracleMode::Spot);
    ASSERT_TRUE(spot);
    EXPECT_EQ(spot->quote.conf_bps, 100u);
    EXPECT_EQ(spot->quote.conf_bps_raw, 300u);
    EXPECT_TRUE(fusion->enforce_confidence_cap(spot->quote, OracleMode::Spot));

    auto strict = fuse(r, OracleMode::Strict);
    ASSERT_TRUE(strict);
    EXPECT_EQ(strict->quote.conf_bps, 80u);
    auto capped = fusion->enforce_confidence_cap(strict->quote, OracleMode::Strict);
    ASSERT_FALSE(capped);
    EXPECT_EQ(capped.error(), ErrorCode::ConfCapExceeded);
}

TEST_F(OracleFusionTest, StrictModeTightensSecondaryAge) {
    OracleReadings r{.primary = sample(2'500), .secondary = sample(2'510, 30)};

    auto spot = fuse(r, OracleMode::Spot);
    ASSERT_TRUE(spot);
    EXPECT_TRUE(spot->quote.divergence_checkable);
    EXPECT_EQ(spot->quote.delta_bps, 40u);

    auto strict = fuse(r, OracleMode::Strict);
    ASSERT_TRUE(strict);
    EXPECT_FALSE(strict->quote.divergence_checkable);
    EXPECT_EQ(strict->quote.delta_bps, 0u);
}

TEST_F(OracleFusionTest, SigmaEwmaAdvancesOncePerBlock) {
    OracleState prev{.last_mid = usd(2'500), .sigma_bps = 0, .last_block = 1};

    // 25.00 -> 25.25 is a 100 bps move; (9000 * 0 + 1000 * 100) / 10000 = 10
    OracleState next = fusion->advance_sigma(prev, usd(2'525), 2);
    EXPECT_EQ(next.sigma_bps, 10u);
    EXPECT_EQ(next.last_mid, usd(2'525));
    EXPECT_EQ(next.last_block, 2u);

    // Same block: no second update
    EXPECT_EQ(fusion->advance_sigma(next, usd(2'600), 2), next);

    // (9000 * 10 + 1000 * 0) / 10000 = 9
    OracleState calm = fusion->advance_sigma(next, usd(2'525), 3);
    EXPECT_EQ(calm.sigma_bps, 9u);
}

TEST_F(OracleFusionTest, SigmaFeedsConfidence) {
    OracleReadings r{.primary = sample(2'525), .secondary = sample(2'525)};
    OracleState prev{.last_mid = usd(2'500), .sigma_bps = 50, .last_block = 1};

    auto out = fusion->fuse(r, OracleMode::Spot, prev, 2);
    ASSERT_TRUE(out);
    // (9000 * 50 + 1000 * 100) / 10000 = 55
    EXPECT_EQ(out->quote.sigma_bps, 55u);
    EXPECT_EQ(out->quote.conf_bps, 55u);
    EXPECT_EQ(out->next_state.sigma_bps, 55u);
}

TEST(DerivePairSampleTest, CombinesTwoUsdFeeds) {
    OracleSample base_usd{.mid = kWad * 25, .conf_bps = 10, .age_sec = 3};
    OracleSample quote_usd{.mid = kWad, .conf_bps = 5, .age_sec = 7};

    OracleSample pair = derive_pair_sample(base_usd, quote_usd);
    EXPECT_EQ(pair.mid, kWad * 25);
    EXPECT_EQ(pair.conf_bps, 15u);
    EXPECT_EQ(pair.age_sec, 7u);
    EXPECT_EQ(pair.status, OracleStatus::Ok);

    quote_usd.status = OracleStatus::Stale;
    EXPECT_EQ(derive_pair_sample(base_usd, quote_usd).status, OracleStatus::Stale);

    quote_usd.mid = 0;
    quote_usd.status = OracleStatus::Ok;
    OracleSample broken = derive_pair_sample(base_usd, quote_usd);
    EXPECT_EQ(broken.mid, 0);
    EXPECT_EQ(broken.status, OracleStatus::Stale);
}
