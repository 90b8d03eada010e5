#include "memory.hpp"
#include <algorithm>
#include <cmath>

namespace taleweave {

static double clamp_unit(double v) {
    if (std::isnan(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

MemoryRecord make_episodic(std::string id, std::string text, std::string owner_id,
                           Timestamp created_at, EpisodicDetails details) {
    MemoryRecord record;
    record.id = std::move(id);
    record.text = std::move(text);
    record.owner_id = std::move(owner_id);
    record.created_at = created_at;
    record.details = std::move(details);
    return record;
}

MemoryRecord make_semantic(std::string id, std::string text, std::string owner_id,
                           Timestamp created_at, SemanticDetails details) {
    MemoryRecord record;
    record.id = std::move(id);
    record.text = std::move(text);
    record.owner_id = std::move(owner_id);
    record.created_at = created_at;
    record.details = std::move(details);
    return record;
}

void normalize_record(MemoryRecord& record) {
    if (auto* ep = std::get_if<EpisodicDetails>(&record.details)) {
        ep->importance = clamp_unit(ep->importance);
        ep->decay_rate = clamp_unit(ep->decay_rate);
        auto& p = ep->participants;
        std::sort(p.begin(), p.end());
        p.erase(std::unique(p.begin(), p.end()), p.end());
    } else if (auto* sem = std::get_if<SemanticDetails>(&record.details)) {
        sem->confidence = clamp_unit(sem->confidence);
    }
}

std::string generate_memory_id() {
    return "mem_" + generate_id().substr(0, 8);
}

std::string kind_to_string(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Episodic: return "episodic";
        case MemoryKind::Semantic: return "semantic";
    }
    return "episodic";
}

std::optional<MemoryKind> kind_from_string(const std::string& s) {
    if (s == "episodic") return MemoryKind::Episodic;
    if (s == "semantic") return MemoryKind::Semantic;
    return std::nullopt;
}

std::string emotion_to_string(Emotion emotion) {
    switch (emotion) {
        case Emotion::Gratitude: return "gratitude";
        case Emotion::Fear:      return "fear";
        case Emotion::Anger:     return "anger";
        case Emotion::Joy:       return "joy";
        case Emotion::Neutral:   return "neutral";
        case Emotion::Sadness:   return "sadness";
    }
    return "neutral";
}

std::optional<Emotion> emotion_from_string(const std::string& s) {
    if (s == "gratitude") return Emotion::Gratitude;
    if (s == "fear")      return Emotion::Fear;
    if (s == "anger")     return Emotion::Anger;
    if (s == "joy")       return Emotion::Joy;
    if (s == "neutral")   return Emotion::Neutral;
    if (s == "sadness")   return Emotion::Sadness;
    return std::nullopt;
}

std::string fact_type_to_string(FactType type) {
    switch (type) {
        case FactType::Profession:   return "profession";
        case FactType::Relationship: return "relationship";
        case FactType::Reputation:   return "reputation";
        case FactType::QuestStatus:  return "quest_status";
        case FactType::General:      return "general";
    }
    return "general";
}

std::optional<FactType> fact_type_from_string(const std::string& s) {
    if (s == "profession")   return FactType::Profession;
    if (s == "relationship") return FactType::Relationship;
    if (s == "reputation")   return FactType::Reputation;
    if (s == "quest_status") return FactType::QuestStatus;
    if (s == "general")      return FactType::General;
    return std::nullopt;
}

} // namespace taleweave
