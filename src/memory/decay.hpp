#pragma once
#include "../memory.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace taleweave {

// Time scale of the decay exponent, in hours:
//   strength = importance * exp(-decay_rate * elapsed_hours / kDecayTimeScaleHours)
inline constexpr double kDecayTimeScaleHours = 100.0;

inline constexpr double kDefaultPruneThreshold = 0.1;
inline constexpr double kDefaultWeakThreshold = 0.3;

enum class MemoryState { Active, Weak, Pruned };

std::string state_to_string(MemoryState state);

// Hours between created_at and now. Negative spans clamp to 0.
double elapsed_hours(Timestamp created_at, Timestamp now);

// Decayed strength after elapsed_hours (negative clamps to 0).
// Non-increasing in elapsed time and never above importance.
double decay_strength(double importance, double decay_rate, double elapsed_hours);

// Result of one decay sweep over a record set.
struct DecaySweep {
    uint32_t active = 0;
    uint32_t weak = 0;
    std::vector<std::string> pruned_ids;
};

class DecayEngine {
public:
    // Thresholds are clamped: prune into [0,1], weak into [prune,1].
    explicit DecayEngine(double prune_threshold = kDefaultPruneThreshold,
                         double weak_threshold = kDefaultWeakThreshold);

    double prune_threshold() const { return prune_threshold_; }
    double weak_threshold() const { return weak_threshold_; }

    // Current strength of a record. Semantic records are always 1.0.
    double strength(const MemoryRecord& record, Timestamp now) const;

    MemoryState state(const MemoryRecord& record, Timestamp now) const;

    bool should_prune(const MemoryRecord& record, Timestamp now) const {
        return state(record, now) == MemoryState::Pruned;
    }

    // Classify every record at `now` and collect the ids to prune.
    // Does not modify the records.
    DecaySweep sweep(const std::vector<MemoryRecord>& records, Timestamp now) const;

private:
    double prune_threshold_;
    double weak_threshold_;
};

} // namespace taleweave
