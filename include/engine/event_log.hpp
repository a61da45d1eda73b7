#pragma once

#include "engine/engine_events.hpp"

#include <mutex>
#include <ostream>

namespace dnmm {

// Writes one tagged key=value line per event.
class StreamEventLog : public IEngineObserver {
public:
    explicit StreamEventLog(std::ostream& out);

    void on_divergence_haircut(const DivergenceHaircutEvent& e) override;
    void on_divergence_rejected(const DivergenceRejectedEvent& e) override;
    void on_aomq_activated(const AomqActivatedEvent& e) override;
    void on_recenter_committed(const RecenterCommittedEvent& e) override;
    void on_preview_snapshot_refreshed(const PreviewSnapshotRefreshedEvent& e) override;

private:
    std::ostream& out_;
    std::mutex    mu_;
};

} // namespace dnmm
