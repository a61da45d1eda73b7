#pragma once

#include "math/fixed_point.hpp"

#include <cstdint>

namespace dnmm {

struct DivergenceHaircutEvent {
    Bps      delta_bps   = 0;
    Bps      haircut_bps = 0;
    uint64_t block       = 0;
};

struct DivergenceRejectedEvent {
    Bps      delta_bps = 0;
    Bps      hard_bps  = 0;
    uint64_t block     = 0;
};

enum class AomqTrigger : uint8_t { Divergence, ConfidenceCap, NearFloor };

const char* to_string(AomqTrigger trigger);

struct AomqActivatedEvent {
    AomqTrigger trigger          = AomqTrigger::NearFloor;
    uint256     trigger_notional = 0;   // quote native units of the original request
    uint256     amount_in        = 0;   // after clamping
    Bps         fee_bps          = 0;
    bool        is_base_in       = true;
    uint64_t    block            = 0;
};

struct RecenterCommittedEvent {
    uint256  new_target    = 0;
    uint256  mid           = 0;
    Bps      deviation_bps = 0;
    bool     manual        = false;
    uint64_t timestamp     = 0;
};

struct PreviewSnapshotRefreshedEvent {
    uint64_t timestamp      = 0;
    uint256  mid            = 0;
    Bps      sigma_bps      = 0;
    Bps      conf_bps       = 0;
    Bps      divergence_bps = 0;
};

class IEngineObserver {
public:
    virtual ~IEngineObserver() = default;
    virtual void on_divergence_haircut(const DivergenceHaircutEvent& e) = 0;
    virtual void on_divergence_rejected(const DivergenceRejectedEvent& e) = 0;
    virtual void on_aomq_activated(const AomqActivatedEvent& e) = 0;
    virtual void on_recenter_committed(const RecenterCommittedEvent& e) = 0;
    virtual void on_preview_snapshot_refreshed(const PreviewSnapshotRefreshedEvent& e) = 0;
};

class NullEngineObserver : public IEngineObserver {
public:
    void on_divergence_haircut(const DivergenceHaircutEvent&) override { ++haircuts_; }
    void on_divergence_rejected(const DivergenceRejectedEvent&) override { ++rejections_; }
    void on_aomq_activated(const AomqActivatedEvent&) override { ++aomq_; }
    void on_recenter_committed(const RecenterCommittedEvent&) override { ++recenters_; }
    void on_preview_snapshot_refreshed(const PreviewSnapshotRefreshedEvent&) override { ++refreshes_; }

    uint64_t haircuts()   const { return haircuts_; }
    uint64_t rejections() const { return rejections_; }
    uint64_t aomq()       const { return aomq_; }
    uint64_t recenters()  const { return recenters_; }
    uint64_t refreshes()  const { return refreshes_; }

private:
    uint64_t haircuts_   = 0;
    uint64_t rejections_ = 0;
    uint64_t aomq_       = 0;
    uint64_t recenters_  = 0;
    uint64_t refreshes_  = 0;
};

} // namespace dnmm
