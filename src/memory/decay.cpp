#include "decay.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace taleweave {

std::string state_to_string(MemoryState state) {
    switch (state) {
        case MemoryState::Active: return "active";
        case MemoryState::Weak:   return "weak";
        case MemoryState::Pruned: return "pruned";
    }
    return "active";
}

double elapsed_hours(Timestamp created_at, Timestamp now) {
    if (now <= created_at) return 0.0;
    return static_cast<double>(now - created_at) / 3600.0;
}

double decay_strength(double importance, double decay_rate, double elapsed_hours) {
    double t = std::max(0.0, elapsed_hours);
    if (decay_rate <= 0.0) return importance;
    return importance * std::exp(-decay_rate * t / kDecayTimeScaleHours);
}

static double clamp_threshold(double v, double lo, double hi, const char* name) {
    double clamped = std::isnan(v) ? lo : std::clamp(v, lo, hi);
    if (clamped != v) {
        std::cerr << "[decay] " << name << " " << v << " out of range, using "
                  << clamped << "\n";
    }
    return clamped;
}

DecayEngine::DecayEngine(double prune_threshold, double weak_threshold)
    : prune_threshold_(clamp_threshold(prune_threshold, 0.0, 1.0, "prune_threshold"))
    , weak_threshold_(clamp_threshold(weak_threshold, prune_threshold_, 1.0, "weak_threshold"))
{}

double DecayEngine::strength(const MemoryRecord& record, Timestamp now) const {
    const auto* ep = record.episodic();
    if (!ep) return 1.0;
    return decay_strength(ep->importance, ep->decay_rate,
                          elapsed_hours(record.created_at, now));
}

MemoryState DecayEngine::state(const MemoryRecord& record, Timestamp now) const {
    if (!record.episodic()) return MemoryState::Active;

    double s = strength(record, now);
    if (s < prune_threshold_) return MemoryState::Pruned;
    if (s < weak_threshold_) return MemoryState::Weak;
    return MemoryState::Active;
}

DecaySweep DecayEngine::sweep(const std::vector<MemoryRecord>& records, Timestamp now) const {
    DecaySweep result;
    for (const auto& record : records) {
        switch (state(record, now)) {
            case MemoryState::Active: result.active++; break;
            case MemoryState::Weak:   result.weak++; break;
            case MemoryState::Pruned: result.pruned_ids.push_back(record.id); break;
        }
    }
    return result;
}

} // namespace taleweave
