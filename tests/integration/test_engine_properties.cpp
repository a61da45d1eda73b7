#include <gtest/gtest.h>
#include "engine/dnmm_engine.hpp"

#include <memory>
#include <random>

using namespace dnmm;

namespace {

uint256 price(uint64_t cents) { return uint256(cents) * kWad / 100; }

OracleReadings readings(uint64_t mid_cents, uint64_t secondary_cents, Bps secondary_conf) {
    OracleReadings r;
    r.primary.mid = price(mid_cents);
    r.primary.bid = price(mid_cents - 1);
    r.primary.ask = price(mid_cents + 1);
    r.secondary = OracleSample{.mid = price(secondary_cents), .conf_bps = secondary_conf};
    return r;
}

} // namespace

class EnginePropertiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        tokens = make_token_pair(18, 6);
    }

    std::unique_ptr<DnmmEngine> make(const InventoryState& inv) {
        return std::make_unique<DnmmEngine>(config, tokens, inv);
    }

    EngineConfig config;
    TokenPair tokens;
    std::mt19937_64 rng{20240611};
};

TEST_F(EnginePropertiesTest, SwapsNeverBreachTheFloor) {
    InventoryEngine inventory(config.inventory, tokens);
    std::uniform_int_distribution<uint64_t> reserve_dist(1, 1'000'000);
    std::uniform_int_distribution<uint64_t> amount_dist(1, 200'000);
    std::uniform_int_distribution<uint64_t> mid_dist(1'000, 5'000);

    for (int i = 0; i < 300; ++i) {
        InventoryState inv;
        inv.base_reserves = uint256(reserve_dist(rng)) * kWad / 10;
        inv.quote_reserves = uint256(reserve_dist(rng)) * 1'000'000;
        inv.target_base_star = inv.base_reserves;
        inv.last_rebalance_price = price(2'500);
        auto engine = make(inv);

        const bool base_in = (rng() & 1) != 0;
        const uint64_t mid = mid_dist(rng);
        const uint256 amount = base_in ? uint256(amount_dist(rng)) * kWad / 10
                                       : uint256(amount_dist(rng)) * 1'000'000;

        auto r = engine->swap(QuoteRequest{.amount_in = amount, .is_base_in = base_in},
                              readings(mid, mid, 0), BlockTime{.timestamp = 1, .block = 1});
        ASSERT_TRUE(r) << "iteration " << i;

        const InventoryState after = engine->state().inventory;
        const uint256 reserve_before = base_in ? inv.quote_reserves : inv.base_reserves;
        const uint256 reserve_after = base_in ? after.quote_reserves : after.base_reserves;
        const uint256 floor = inventory.floor_amount(reserve_before);

        EXPECT_GE(reserve_after, floor) << "iteration " << i;
        EXPECT_LE(r->partial_fill_amount_in, amount);
        if (r->reason == QuoteReason::Floor) {
            EXPECT_EQ(reserve_after, floor) << "iteration " << i;
            EXPECT_TRUE(r->has_flag(kClampFloor));
        } else {
            EXPECT_EQ(r->partial_fill_amount_in, amount);
        }

        // Reserves move by exactly what was paid and received.
        if (base_in) {
            EXPECT_EQ(after.base_reserves, inv.base_reserves + r->partial_fill_amount_in);
            EXPECT_EQ(after.quote_reserves, inv.quote_reserves - r->amount_out);
        } else {
            EXPECT_EQ(after.quote_reserves, inv.quote_reserves + r->partial_fill_amount_in);
            EXPECT_EQ(after.base_reserves, inv.base_reserves - r->amount_out);
        }
    }
}

TEST_F(EnginePropertiesTest, FeeStaysWithinBaseAndCap) {
    config.oracle.conf_cap_bps_spot = 2'000;
    config.flags.enable_size_fee = true;
    config.fee.gamma_size_lin_bps = 12;
    config.fee.gamma_size_quad_bps = 3;
    config.fee.size_fee_cap_bps = 80;
    config.flags.enable_inv_tilt = true;
    config.inventory.inv_tilt_bps_per_1pct = 8;
    config.inventory.inv_tilt_max_bps = 40;

    InventoryState inv{
        .base_reserves        = uint256(100'000) * kWad,
        .quote_reserves       = uint256(2'500'000) * 1'000'000,
        .target_base_star     = uint256(100'000) * kWad,
        .last_rebalance_price = price(2'500),
    };
    auto engine = make(inv);

    std::uniform_int_distribution<uint64_t> mid_dist(2'400, 2'600);
    std::uniform_int_distribution<uint64_t> drift_dist(0, 20);
    std::uniform_int_distribution<Bps> conf_dist(0, 1'500);
    std::uniform_int_distribution<uint64_t> amount_dist(1, 5'000);

    uint64_t block = 1;
    for (int i = 0; i < 400; ++i) {
        block += rng() % 3;
        const uint64_t mid = mid_dist(rng);
        const bool base_in = (rng() & 1) != 0;
        const uint256 amount = base_in ? uint256(amount_dist(rng)) * kWad
                                       : uint256(amount_dist(rng)) * 25'000'000;
        auto r = engine->swap(QuoteRequest{.amount_in = amount, .is_base_in = base_in},
                              readings(mid, mid + drift_dist(rng), conf_dist(rng)),
                              BlockTime{.timestamp = block * 2, .block = block});
        if (!r) {
            EXPECT_EQ(r.error(), ErrorCode::OracleDiverged);
            continue;
        }
        EXPECT_GE(r->fee_bps_used, config.fee.base_bps) << "iteration " << i;
        EXPECT_LE(r->fee_bps_used, config.fee.cap_bps) << "iteration " << i;
        EXPECT_EQ(engine->state().fee.last_fee_bps, r->fee_bps_used);
    }
}

TEST_F(EnginePropertiesTest, FeeNonDecreasingInDeviation) {
    Bps last = 0;
    for (uint64_t base = 1'000; base <= 3'000; base += 50) {
        InventoryState inv{
            .base_reserves        = uint256(base) * kWad,
            .quote_reserves       = uint256(25'000) * 1'000'000,
            .target_base_star     = uint256(1'000) * kWad,
            .last_rebalance_price = price(2'500),
        };
        auto engine = make(inv);
        auto r = engine->quote(QuoteRequest{.amount_in = kWad, .is_base_in = true},
                               readings(2'500, 2'500, 0), BlockTime{.timestamp = 1, .block = 1});
        ASSERT_TRUE(r);
        EXPECT_GE(r->fee_bps_used, last) << "base=" << base;
        last = r->fee_bps_used;
    }
    EXPECT_EQ(last, config.fee.cap_bps);
}

TEST_F(EnginePropertiesTest, QuotePredictsSwapAlongAPath) {
    InventoryState inv{
        .base_reserves        = uint256(1'000) * kWad,
        .quote_reserves       = uint256(25'000) * 1'000'000,
        .target_base_star     = uint256(1'000) * kWad,
        .last_rebalance_price = price(2'500),
    };
    auto engine = make(inv);

    std::uniform_int_distribution<uint64_t> mid_dist(2'450, 2'550);
    std::uniform_int_distribution<uint64_t> amount_dist(1, 50);
    uint64_t block = 1;
    for (int i = 0; i < 100; ++i) {
        block += rng() % 2;
        const uint64_t mid = mid_dist(rng);
        const bool base_in = (rng() & 1) != 0;
        const uint256 amount = base_in ? uint256(amount_dist(rng)) * kWad
                                       : uint256(amount_dist(rng)) * 25'000'000;
        const QuoteRequest req{.amount_in = amount, .is_base_in = base_in};
        const OracleReadings r = readings(mid, mid, 5);
        const BlockTime at{.timestamp = block, .block = block};

        auto q = engine->quote(req, r, at);
        auto s = engine->swap(req, r, at);
        ASSERT_EQ(q.has_value(), s.has_value()) << "iteration " << i;
        if (!q) continue;
        EXPECT_EQ(q->amount_out, s->amount_out) << "iteration " << i;
        EXPECT_EQ(q->fee_bps_used, s->fee_bps_used) << "iteration " << i;
        EXPECT_EQ(q->partial_fill_amount_in, s->partial_fill_amount_in) << "iteration " << i;
    }
}
