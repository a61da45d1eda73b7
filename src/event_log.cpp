#include "engine/event_log.hpp"

namespace dnmm {

const char* to_string(AomqTrigger trigger) {
    switch (trigger) {
        case AomqTrigger::Divergence:    return "divergence";
        case AomqTrigger::ConfidenceCap: return "confidence_cap";
        case AomqTrigger::NearFloor:     return "near_floor";
    }
    return "unknown";
}

StreamEventLog::StreamEventLog(std::ostream& out) : out_(out) {}

void StreamEventLog::on_divergence_haircut(const DivergenceHaircutEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[DIVERGENCE] haircut delta_bps=" << e.delta_bps
         << " haircut_bps=" << e.haircut_bps
         << " block=" << e.block << "\n";
}

void StreamEventLog::on_divergence_rejected(const DivergenceRejectedEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[DIVERGENCE] rejected delta_bps=" << e.delta_bps
         << " hard_bps=" << e.hard_bps
         << " block=" << e.block << "\n";
}

void StreamEventLog::on_aomq_activated(const AomqActivatedEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[AOMQ] activated trigger=" << to_string(e.trigger)
         << " side=" << (e.is_base_in ? "base_in" : "quote_in")
         << " trigger_notional=" << e.trigger_notional
         << " amount_in=" << e.amount_in
         << " fee_bps=" << e.fee_bps
         << " block=" << e.block << "\n";
}

void StreamEventLog::on_recenter_committed(const RecenterCommittedEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[RECENTER] committed manual=" << (e.manual ? "true" : "false")
         << " new_target=" << e.new_target
         << " mid=" << e.mid
         << " deviation_bps=" << e.deviation_bps
         << " ts=" << e.timestamp << "\n";
}

void StreamEventLog::on_preview_snapshot_refreshed(const PreviewSnapshotRefreshedEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "[PREVIEW] refreshed ts=" << e.timestamp
         << " mid=" << e.mid
         << " sigma_bps=" << e.sigma_bps
         << " conf_bps=" << e.conf_bps
         << " divergence_bps=" << e.divergence_bps << "\n";
}

} // namespace dnmm
