#include "engine/dnmm_engine.hpp"

#include "oracle/oracle_fusion.hpp"
#include "strategy/aomq_planner.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace dnmm {

DnmmEngine::DnmmEngine(EngineConfig config,
                       TokenPair tokens,
                       InventoryState initial,
                       IEngineObserver* observer)
    : config_(std::move(config)),
      tokens_(std::move(tokens)),
      observer_(observer != nullptr ? observer : &null_observer_) {
    if (auto valid = validate_engine_config(config_); !valid) {
        throw std::invalid_argument(std::string("invalid engine config: ").append(to_string(valid.error())));
    }
    state_.inventory = std::move(initial);
    state_.fee = FeeState{.last_fee_bps = config_.fee.base_bps, .last_block = 0};
}

Result<std::unique_ptr<DnmmEngine>> DnmmEngine::create(EngineConfig config,
                                                       TokenPair tokens,
                                                       InventoryState initial,
                                                       IEngineObserver* observer) {
    if (auto valid = validate_engine_config(config); !valid) {
        return Unexpected(valid.error());
    }
    return std::make_unique<DnmmEngine>(std::move(config), std::move(tokens),
                                        std::move(initial), observer);
}

Bps DnmmEngine::rebate_for(const std::string& caller) const {
    if (caller.empty()) return 0;
    auto it = rebates_.find(caller);
    return it == rebates_.end() ? 0 : it->second;
}

DnmmEngine::Evaluation DnmmEngine::evaluate(const QuoteRequest& req,
                                            const OracleReadings& readings,
                                            const BlockTime& at) const {
    Evaluation ev;
    ev.next = state_;

    if (req.amount_in == 0) {
        ev.error = ErrorCode::InvalidAmount;
        return ev;
    }

    OracleFusion fusion(config_.oracle, config_.flags);
    auto fused = fusion.fuse(readings, req.mode, state_.oracle, at.block);
    if (!fused) {
        ev.error = fused.error();
        return ev;
    }
    const FusedQuote& q = fused->quote;
    ev.fused = q;
    ev.next.oracle = fused->next_state;

    InventoryEngine inventory(config_.inventory, tokens_);
    const InventoryState& inv = state_.inventory;
    if (auto sized = inventory.check_amount(inv, req.amount_in, req.is_base_in, q.mid_used); !sized) {
        ev.error = sized.error();
        return ev;
    }

    std::optional<ErrorCode> gate_error;
    if (auto cap = fusion.enforce_confidence_cap(q, req.mode); !cap) {
        gate_error = cap.error();
    }

    DivergenceGate gate(config_.oracle, config_.flags);
    Bps haircut = 0;
    if (auto div = gate.evaluate(state_.divergence, q); div) {
        ev.next.divergence = div->next;
        haircut = div->haircut_bps;
        if (haircut > 0) {
            ev.events.haircut = DivergenceHaircutEvent{
                .delta_bps = q.delta_bps, .haircut_bps = haircut, .block = at.block};
        }
    } else {
        const bool soft = config_.flags.enable_soft_divergence;
        ev.next.divergence = soft ? gate.observe(state_.divergence, q.delta_bps) : state_.divergence;
        ev.next.divergence.last_delta_bps = q.delta_bps;
        ev.events.rejected = DivergenceRejectedEvent{
            .delta_bps = q.delta_bps,
            .hard_bps  = soft ? config_.oracle.divergence_hard_bps : config_.oracle.divergence_bps,
            .block     = at.block,
        };
        if (!gate_error) gate_error = div.error();
    }
    ev.gate_failed = gate_error.has_value();

    FeeEngine fees(config_.fee, config_.inventory, config_.maker, config_.flags);
    AomqPlanner aomq(config_.aomq, config_.fee, config_.flags);

    auto fail = [&ev](ErrorCode code) {
        ev.error = code;
        ev.events.haircut.reset();
        ev.events.aomq.reset();
        return ev;
    };

    const uint256 trade_notional = req.is_base_in ? inventory.base_to_quote(req.amount_in, q.mid_used)
                                                  : req.amount_in;

    FeeInputs in{
        .conf_bps                = q.conf_bps,
        .inventory_deviation_bps = inventory.deviation_bps(inv, q.mid_used),
        .tilt                    = inventory.tilt_direction(inv, req.is_base_in),
        .spread_bps              = q.spread_bps,
        .has_spread              = q.has_spread,
        .sigma_bps               = q.sigma_bps,
        .trade_notional          = trade_notional,
        .haircut_bps             = gate_error ? Bps{0} : haircut,
        .block                   = at.block,
    };
    const FeeBreakdown breakdown = fees.compute(state_.fee, in);

    // Gross output at the mid, before any fee.
    const uint256 projected_out = req.is_base_in ? trade_notional
                                                 : inventory.quote_to_base(req.amount_in, q.mid_used);
    const bool near_floor = aomq.near_floor(inventory.output_reserve(inv, req.is_base_in),
                                            inventory.headroom(inv, req.is_base_in),
                                            projected_out);

    bool use_aomq = false;
    AomqTrigger trigger = AomqTrigger::NearFloor;
    if (gate_error) {
        if (!aomq.enabled() || !AomqPlanner::routes_gate_failure(*gate_error)) {
            return fail(*gate_error);
        }
        use_aomq = true;
        trigger = *gate_error == ErrorCode::OracleDiverged ? AomqTrigger::Divergence
                                                           : AomqTrigger::ConfidenceCap;
    } else if (near_floor && aomq.enabled()) {
        use_aomq = true;
    }

    uint256 amount_in = req.amount_in;
    Bps fee_used = 0;
    if (use_aomq) {
        ev.events.haircut.reset();
        amount_in = aomq.clamp_amount_in(req.amount_in, req.is_base_in, q.mid_used, inventory);
        fee_used = aomq.emergency_fee(breakdown.fee_bps);
    } else {
        fee_used = fees.apply_rebate(breakdown, rebate_for(req.caller));
    }
    if (amount_in == 0) {
        return fail(gate_error.value_or(ErrorCode::FloorReached));
    }

    auto filled = inventory.fill(inv, amount_in, req.is_base_in, q.mid_used, fee_used);
    if (!filled) {
        if (gate_error && filled.error() == ErrorCode::FloorReached) {
            return fail(*gate_error);
        }
        return fail(filled.error());
    }

    uint16_t flags = 0;
    if (use_aomq)                 flags |= kClampAomq;
    if (q.used_fallback)          flags |= kClampFallback;
    if (near_floor)               flags |= kClampNearFloor;
    if (breakdown.size_applied)   flags |= kClampSizeFee;
    if (breakdown.tilt_applied)   flags |= kClampInvTilt;
    if (filled->partial)          flags |= kClampFloor;

    QuoteReason reason = QuoteReason::Ok;
    if (use_aomq) {
        reason = QuoteReason::AomqClamp;
    } else if (filled->partial) {
        reason = QuoteReason::Floor;
    }

    ev.result = QuoteResult{
        .amount_out             = filled->amount_out,
        .mid_used               = q.mid_used,
        .fee_bps_used           = fee_used,
        .partial_fill_amount_in = filled->amount_in,
        .used_fallback          = q.used_fallback,
        .source                 = q.source_reason,
        .reason                 = reason,
        .clamp_flags            = flags,
        .divergence_haircut_bps = use_aomq ? Bps{0} : haircut,
    };

    if (use_aomq) {
        ev.events.aomq = AomqActivatedEvent{
            .trigger          = trigger,
            .trigger_notional = trade_notional,
            .amount_in        = filled->amount_in,
            .fee_bps          = fee_used,
            .is_base_in       = req.is_base_in,
            .block            = at.block,
        };
    }

    ev.next.fee = fees.settle(breakdown, at.block);
    ev.next.inventory = inventory.apply(inv, *filled, req.is_base_in);
    return ev;
}

Result<QuoteResult> DnmmEngine::quote(const QuoteRequest& req,
                                      const OracleReadings& readings,
                                      const BlockTime& at) const {
    std::shared_lock lock(mu_);
    Evaluation ev = evaluate(req, readings, at);
    if (ev.error) {
        return Unexpected(*ev.error);
    }
    return ev.result;
}

Result<QuoteResult> DnmmEngine::swap(const QuoteRequest& req,
                                     const OracleReadings& readings,
                                     const BlockTime& at) {
    Evaluation ev;
    {
        std::unique_lock lock(mu_);
        ev = evaluate(req, readings, at);
        if (ev.error) {
            // A rejected sample still breaks the hysteresis streak.
            if (ev.events.rejected) {
                state_.divergence = ev.next.divergence;
            }
        } else {
            state_ = ev.next;

            // Mids the gates refused are not recenter inputs.
            if (!ev.gate_failed) {
                InventoryEngine inventory(config_.inventory, tokens_);
                RecenterController recenter(config_.inventory, inventory);
                if (config_.flags.enable_auto_recenter) {
                    RecenterOutcome out = recenter.step(state_.inventory, state_.recenter, ev.fused, at.timestamp);
                    state_.inventory = out.inventory;
                    state_.recenter = out.recenter;
                    if (out.committed) {
                        ev.events.recenter = RecenterCommittedEvent{
                            .new_target    = out.inventory.target_base_star,
                            .mid           = ev.fused.mid_used,
                            .deviation_bps = out.deviation_bps,
                            .manual        = false,
                            .timestamp     = at.timestamp,
                        };
                    }
                } else {
                    state_.recenter = recenter.observe(state_.inventory, state_.recenter, ev.fused);
                }
            }
        }
    }

    publish(ev.events);
    if (ev.error) {
        return Unexpected(*ev.error);
    }
    return ev.result;
}

PreviewFees DnmmEngine::fees_from_snapshot(const PreviewSnapshot& snap,
                                           const std::vector<uint256>& sizes,
                                           uint64_t block,
                                           std::vector<PreviewLadderRow>* rows) const {
    InventoryEngine inventory(config_.inventory, tokens_);
    FeeEngine fees(config_.fee, config_.inventory, config_.maker, config_.flags);
    const InventoryState& inv = state_.inventory;
    const Bps deviation = inventory.deviation_bps(inv, snap.mid_used);

    auto fee_for = [&](const uint256& notional, bool is_base_in) {
        FeeInputs in{
            .conf_bps                = snap.conf_bps,
            .inventory_deviation_bps = deviation,
            .tilt                    = inventory.tilt_direction(inv, is_base_in),
            .spread_bps              = snap.spread_bps,
            .has_spread              = snap.has_spread,
            .sigma_bps               = snap.sigma_bps,
            .trade_notional          = notional,
            .haircut_bps             = snap.haircut_bps,
            .block                   = block,
        };
        return fees.compute(state_.fee, in).fee_bps;
    };

    auto clamped = [&](const uint256& amount_in, bool is_base_in, Bps fee) {
        if (amount_in == 0) return false;
        auto f = inventory.fill(inv, amount_in, is_base_in, snap.mid_used, fee);
        return !f || f->partial;
    };

    PreviewFees out;
    out.ask_fee_bps.reserve(sizes.size());
    out.bid_fee_bps.reserve(sizes.size());
    for (const auto& size : sizes) {
        const uint256 notional = inventory.base_to_quote(size, snap.mid_used);
        const Bps ask = fee_for(notional, false);
        const Bps bid = fee_for(notional, true);
        out.ask_fee_bps.push_back(ask);
        out.bid_fee_bps.push_back(bid);
        if (rows != nullptr) {
            rows->push_back(PreviewLadderRow{
                .size        = size,
                .ask_fee_bps = ask,
                .bid_fee_bps = bid,
                .ask_clamped = clamped(notional, false, ask),
                .bid_clamped = clamped(size, true, bid),
            });
        }
    }
    return out;
}

Result<PreviewFees> DnmmEngine::preview_fees(const std::vector<uint256>& sizes, const BlockTime& at) const {
    std::shared_lock lock(mu_);
    PreviewCache cache(config_.preview);
    auto snap = cache.read(state_.preview, at.timestamp);
    if (!snap) {
        return Unexpected(snap.error());
    }
    return fees_from_snapshot(**snap, sizes, at.block, nullptr);
}

Result<PreviewLadder> DnmmEngine::preview_ladder(const uint256& s0, const BlockTime& at) const {
    std::shared_lock lock(mu_);
    PreviewCache cache(config_.preview);
    auto snap = cache.read(state_.preview, at.timestamp);
    if (!snap) {
        return Unexpected(snap.error());
    }
    const PreviewSnapshot& s = **snap;

    InventoryEngine inventory(config_.inventory, tokens_);
    uint256 base_size = s0;
    if (base_size == 0) {
        base_size = inventory.quote_to_base(config_.maker.s0_notional, s.mid_used);
    }

    const uint32_t largest = kLadderMultiples[std::size(kLadderMultiples) - 1];
    if (base_size > std::numeric_limits<uint256>::max() / largest) {
        return Unexpected(ErrorCode::InvalidAmount);
    }
    if (auto sized = inventory.check_amount(state_.inventory, base_size * largest, true, s.mid_used); !sized) {
        return Unexpected(sized.error());
    }

    std::vector<uint256> sizes;
    for (uint32_t m : kLadderMultiples) {
        sizes.push_back(base_size * m);
    }

    PreviewLadder ladder;
    ladder.snapshot_timestamp = s.timestamp;
    ladder.mid_used = s.mid_used;
    fees_from_snapshot(s, sizes, at.block, &ladder.rows);
    return ladder;
}

Result<PreviewFees> DnmmEngine::preview_fees_fresh(const std::vector<uint256>& sizes,
                                                   OracleMode mode,
                                                   const OracleReadings& readings,
                                                   const BlockTime& at) const {
    std::shared_lock lock(mu_);
    if (!config_.preview.enable_preview_fresh) {
        return Unexpected(ErrorCode::InvalidConfig);
    }

    OracleFusion fusion(config_.oracle, config_.flags);
    auto fused = fusion.fuse(readings, mode, state_.oracle, at.block);
    if (!fused) {
        return Unexpected(fused.error());
    }
    if (auto cap = fusion.enforce_confidence_cap(fused->quote, mode); !cap) {
        return Unexpected(cap.error());
    }
    DivergenceGate gate(config_.oracle, config_.flags);
    auto div = gate.evaluate(state_.divergence, fused->quote);
    if (!div) {
        return Unexpected(div.error());
    }

    SnapshotPtr snap = PreviewCache::make(fused->quote, div->haircut_bps, at);
    return fees_from_snapshot(*snap, sizes, at.block, nullptr);
}

Result<PreviewSnapshot> DnmmEngine::refresh_preview_snapshot(OracleMode mode,
                                                             const OracleReadings& readings,
                                                             const BlockTime& at) {
    PendingEvents events;
    SnapshotPtr snap;
    {
        std::unique_lock lock(mu_);
        PreviewCache cache(config_.preview);
        if (auto admitted = cache.admit_refresh(state_.preview, at.timestamp); !admitted) {
            return Unexpected(admitted.error());
        }

        OracleFusion fusion(config_.oracle, config_.flags);
        auto fused = fusion.fuse(readings, mode, state_.oracle, at.block);
        if (!fused) {
            return Unexpected(fused.error());
        }
        if (auto cap = fusion.enforce_confidence_cap(fused->quote, mode); !cap) {
            return Unexpected(cap.error());
        }
        DivergenceGate gate(config_.oracle, config_.flags);
        auto div = gate.evaluate(state_.divergence, fused->quote);
        if (!div) {
            return Unexpected(div.error());
        }

        snap = PreviewCache::make(fused->quote, div->haircut_bps, at);
        state_.preview = snap;
        events.refreshed = PreviewSnapshotRefreshedEvent{
            .timestamp      = snap->timestamp,
            .mid            = snap->mid_used,
            .sigma_bps      = snap->sigma_bps,
            .conf_bps       = snap->conf_bps,
            .divergence_bps = snap->divergence_bps,
        };
    }
    publish(events);
    return *snap;
}

Result<uint256> DnmmEngine::rebalance_target(const OracleReadings& readings, const BlockTime& at) {
    PendingEvents events;
    uint256 target;
    {
        std::unique_lock lock(mu_);
        OracleFusion fusion(config_.oracle, config_.flags);
        auto fused = fusion.fuse(readings, OracleMode::Spot, state_.oracle, at.block);
        if (!fused) {
            return Unexpected(fused.error());
        }
        if (auto cap = fusion.enforce_confidence_cap(fused->quote, OracleMode::Spot); !cap) {
            return Unexpected(cap.error());
        }
        DivergenceGate gate(config_.oracle, config_.flags);
        if (auto div = gate.evaluate(state_.divergence, fused->quote); !div) {
            return Unexpected(div.error());
        }

        InventoryEngine inventory(config_.inventory, tokens_);
        RecenterController recenter(config_.inventory, inventory);
        auto out = recenter.manual(state_.inventory, state_.recenter, fused->quote, at.timestamp);
        if (!out) {
            return Unexpected(out.error());
        }

        state_.inventory = out->inventory;
        state_.recenter = out->recenter;
        target = out->inventory.target_base_star;
        events.recenter = RecenterCommittedEvent{
            .new_target    = target,
            .mid           = fused->quote.mid_used,
            .deviation_bps = out->deviation_bps,
            .manual        = true,
            .timestamp     = at.timestamp,
        };
    }
    publish(events);
    return target;
}

template <class Mutate>
Status DnmmEngine::update_config(Mutate&& mutate) {
    std::unique_lock lock(mu_);
    EngineConfig candidate = config_;
    mutate(candidate);
    if (auto valid = validate_engine_config(candidate); !valid) {
        return valid;
    }
    config_ = std::move(candidate);
    state_.fee.last_fee_bps = fp::clamp_bps(state_.fee.last_fee_bps, config_.fee.base_bps, config_.fee.cap_bps);
    return {};
}

Status DnmmEngine::update_fee_config(const FeeConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.fee = c; });
}

Status DnmmEngine::update_oracle_config(const OracleConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.oracle = c; });
}

Status DnmmEngine::update_inventory_config(const InventoryConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.inventory = c; });
}

Status DnmmEngine::update_maker_config(const MakerConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.maker = c; });
}

Status DnmmEngine::update_aomq_config(const AomqConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.aomq = c; });
}

Status DnmmEngine::update_preview_config(const PreviewConfig& c) {
    return update_config([&c](EngineConfig& cfg) { cfg.preview = c; });
}

Status DnmmEngine::update_feature_flags(const FeatureFlags& f) {
    return update_config([&f](EngineConfig& cfg) { cfg.flags = f; });
}

Status DnmmEngine::set_rebate(const std::string& caller, Bps rebate_bps) {
    if (caller.empty() || rebate_bps > kMaxRebateBps) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    std::unique_lock lock(mu_);
    if (rebate_bps == 0) {
        rebates_.erase(caller);
    } else {
        rebates_[caller] = rebate_bps;
    }
    return {};
}

EngineState DnmmEngine::state() const {
    std::shared_lock lock(mu_);
    return state_;
}

EngineConfig DnmmEngine::config() const {
    std::shared_lock lock(mu_);
    return config_;
}

void DnmmEngine::publish(const PendingEvents& events) {
    if (events.rejected)  observer_->on_divergence_rejected(*events.rejected);
    if (events.haircut)   observer_->on_divergence_haircut(*events.haircut);
    if (events.aomq)      observer_->on_aomq_activated(*events.aomq);
    if (events.recenter)  observer_->on_recenter_committed(*events.recenter);
    if (events.refreshed) observer_->on_preview_snapshot_refreshed(*events.refreshed);
}

} // namespace dnmm
