#pragma once
#include "util.hpp"
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>

namespace taleweave {

using Embedding = std::vector<float>;

// Owner id shared by every agent. Records owned by it match any owner filter.
inline constexpr const char* kAllAgents = "all";

enum class MemoryKind { Episodic, Semantic };

enum class Emotion { Gratitude, Fear, Anger, Joy, Neutral, Sadness };

enum class FactType { Profession, Relationship, Reputation, QuestStatus, General };

// A specific event. Strength fades with time (see memory/decay.hpp).
struct EpisodicDetails {
    double importance = 0.5;                // [0,1]
    Emotion emotion = Emotion::Neutral;
    std::string location;
    std::vector<std::string> participants;  // sorted, unique after normalize_record()
    double decay_rate = 0.1;                // [0,1], 0 = never decays
};

// A persistent fact. Never decays.
struct SemanticDetails {
    FactType fact_type = FactType::General;
    std::string subject;
    double confidence = 1.0;                // [0,1]
    std::string source;
};

struct MemoryRecord {
    std::string id;
    std::string text;
    std::string owner_id;
    Timestamp created_at = 0;
    Embedding embedding;  // empty when no vector is available
    std::variant<EpisodicDetails, SemanticDetails> details;

    MemoryKind kind() const {
        return std::holds_alternative<EpisodicDetails>(details) ? MemoryKind::Episodic
                                                                 : MemoryKind::Semantic;
    }
    const EpisodicDetails* episodic() const { return std::get_if<EpisodicDetails>(&details); }
    const SemanticDetails* semantic() const { return std::get_if<SemanticDetails>(&details); }

    // True if a caller scoped to owner may see this record.
    // An empty owner means "no scoping".
    bool visible_to(const std::string& owner) const {
        return owner.empty() || owner_id == owner || owner_id == kAllAgents;
    }
};

MemoryRecord make_episodic(std::string id, std::string text, std::string owner_id,
                           Timestamp created_at, EpisodicDetails details);

MemoryRecord make_semantic(std::string id, std::string text, std::string owner_id,
                           Timestamp created_at, SemanticDetails details);

// Clamp importance/confidence/decay_rate into [0,1] and dedupe participants.
void normalize_record(MemoryRecord& record);

// "mem_" + 8 hex digits
std::string generate_memory_id();

// A retrieval result: the record plus the numbers it was ranked by.
struct RecalledMemory {
    MemoryRecord record;
    double strength = 0.0;    // decayed strength (episodic) or confidence (semantic)
    double similarity = 0.0;  // [0,1], 0 in fallback mode
    double score = 0.0;
};

// Wire-name conversions
std::string kind_to_string(MemoryKind kind);
std::optional<MemoryKind> kind_from_string(const std::string& s);
std::string emotion_to_string(Emotion emotion);
std::optional<Emotion> emotion_from_string(const std::string& s);
std::string fact_type_to_string(FactType type);
std::optional<FactType> fact_type_from_string(const std::string& s);

} // namespace taleweave
