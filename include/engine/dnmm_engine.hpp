#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "config/token_config.hpp"
#include "engine/engine_events.hpp"
#include "engine/preview_cache.hpp"
#include "engine/quote_types.hpp"
#include "oracle/divergence_gate.hpp"
#include "oracle/oracle_types.hpp"
#include "risk/inventory_engine.hpp"
#include "risk/recenter_controller.hpp"
#include "strategy/fee_engine.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dnmm {

// Everything the engine carries between calls.
struct EngineState {
    FeeState        fee;
    DivergenceState divergence;
    InventoryState  inventory;
    OracleState     oracle;
    RecenterState   recenter;
    SnapshotPtr     preview;

    bool operator==(const EngineState&) const = default;
};

class DnmmEngine {
public:
    // Throws std::invalid_argument when `config` fails validation.
    DnmmEngine(EngineConfig config,
               TokenPair tokens,
               InventoryState initial,
               IEngineObserver* observer = nullptr);

    static Result<std::unique_ptr<DnmmEngine>> create(EngineConfig config,
                                                      TokenPair tokens,
                                                      InventoryState initial,
                                                      IEngineObserver* observer = nullptr);

    DnmmEngine(const DnmmEngine&) = delete;
    DnmmEngine& operator=(const DnmmEngine&) = delete;

    // Exactly what swap() would do, without committing anything.
    Result<QuoteResult> quote(const QuoteRequest& req,
                              const OracleReadings& readings,
                              const BlockTime& at) const;

    // Commits fee, divergence, volatility and inventory state, then runs the
    // automatic recenter check.
    Result<QuoteResult> swap(const QuoteRequest& req,
                             const OracleReadings& readings,
                             const BlockTime& at);

    // Previews read the cached snapshot and never write.
    Result<PreviewFees> preview_fees(const std::vector<uint256>& sizes, const BlockTime& at) const;
    Result<PreviewLadder> preview_ladder(const uint256& s0, const BlockTime& at) const;
    Result<PreviewFees> preview_fees_fresh(const std::vector<uint256>& sizes,
                                           OracleMode mode,
                                           const OracleReadings& readings,
                                           const BlockTime& at) const;

    Result<PreviewSnapshot> refresh_preview_snapshot(OracleMode mode,
                                                     const OracleReadings& readings,
                                                     const BlockTime& at);

    // Manual recenter. Returns the new base target.
    Result<uint256> rebalance_target(const OracleReadings& readings, const BlockTime& at);

    Status update_fee_config(const FeeConfig& c);
    Status update_oracle_config(const OracleConfig& c);
    Status update_inventory_config(const InventoryConfig& c);
    Status update_maker_config(const MakerConfig& c);
    Status update_aomq_config(const AomqConfig& c);
    Status update_preview_config(const PreviewConfig& c);
    Status update_feature_flags(const FeatureFlags& f);
    Status set_rebate(const std::string& caller, Bps rebate_bps);

    EngineState  state() const;
    EngineConfig config() const;
    const TokenPair& tokens() const { return tokens_; }

private:
    struct PendingEvents {
        std::optional<DivergenceHaircutEvent>        haircut;
        std::optional<DivergenceRejectedEvent>       rejected;
        std::optional<AomqActivatedEvent>            aomq;
        std::optional<RecenterCommittedEvent>        recenter;
        std::optional<PreviewSnapshotRefreshedEvent> refreshed;
    };

    struct Evaluation {
        QuoteResult              result;
        EngineState              next;
        FusedQuote               fused;
        PendingEvents            events;
        std::optional<ErrorCode> error;
        bool                     gate_failed = false;   // confidence cap or divergence refused the mid
    };

    // Pure; the caller holds the lock.
    Evaluation evaluate(const QuoteRequest& req,
                        const OracleReadings& readings,
                        const BlockTime& at) const;

    PreviewFees fees_from_snapshot(const PreviewSnapshot& snap,
                                   const std::vector<uint256>& sizes,
                                   uint64_t block,
                                   std::vector<PreviewLadderRow>* rows) const;

    Bps rebate_for(const std::string& caller) const;

    template <class Mutate>
    Status update_config(Mutate&& mutate);

    void publish(const PendingEvents& events);

    EngineConfig   config_;
    TokenPair      tokens_;
    EngineState    state_;
    std::unordered_map<std::string, Bps> rebates_;

    NullEngineObserver null_observer_;
    IEngineObserver*   observer_;

    mutable std::shared_mutex mu_;
};

} // namespace dnmm
