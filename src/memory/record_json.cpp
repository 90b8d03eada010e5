#include "record_json.hpp"
#include "vector.hpp"

namespace taleweave {

nlohmann::json record_to_json(const MemoryRecord& record, bool include_embedding) {
    nlohmann::json item = {
        {"id", record.id},
        {"kind", kind_to_string(record.kind())},
        {"text", record.text},
        {"owner_id", record.owner_id},
        {"created_at", format_iso8601(record.created_at)}
    };

    if (const auto* ep = record.episodic()) {
        item["importance"] = ep->importance;
        item["emotion"] = emotion_to_string(ep->emotion);
        item["location"] = ep->location;
        item["participants"] = ep->participants;
        item["decay_rate"] = ep->decay_rate;
    } else if (const auto* sem = record.semantic()) {
        item["fact_type"] = fact_type_to_string(sem->fact_type);
        item["subject"] = sem->subject;
        item["confidence"] = sem->confidence;
        item["source"] = sem->source;
    }

    if (include_embedding && !record.embedding.empty()) {
        item["embedding"] = record.embedding;
    }
    return item;
}

static bool require_string(const nlohmann::json& item, const char* field,
                           std::string& out, std::string& error) {
    auto it = item.find(field);
    if (it == item.end() || !it->is_string()) {
        error = std::string("missing field '") + field + "'";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool require_number(const nlohmann::json& item, const char* field,
                           double& out, std::string& error) {
    auto it = item.find(field);
    if (it == item.end() || !it->is_number()) {
        error = std::string("missing field '") + field + "'";
        return false;
    }
    out = it->get<double>();
    return true;
}

static std::string optional_string(const nlohmann::json& item, const char* field) {
    auto it = item.find(field);
    if (it != item.end() && it->is_string()) return it->get<std::string>();
    return {};
}

static std::optional<EpisodicDetails> episodic_from_json(const nlohmann::json& item,
                                                         std::string& error) {
    EpisodicDetails ep;
    std::string emotion;
    if (!require_number(item, "importance", ep.importance, error)) return std::nullopt;
    if (!require_number(item, "decay_rate", ep.decay_rate, error)) return std::nullopt;
    if (!require_string(item, "emotion", emotion, error)) return std::nullopt;

    auto parsed = emotion_from_string(emotion);
    if (!parsed) {
        error = "unknown emotion '" + emotion + "'";
        return std::nullopt;
    }
    ep.emotion = *parsed;
    ep.location = optional_string(item, "location");

    auto it = item.find("participants");
    if (it != item.end() && it->is_array()) {
        for (const auto& p : *it) {
            if (p.is_string()) ep.participants.push_back(p.get<std::string>());
        }
    }
    return ep;
}

static std::optional<SemanticDetails> semantic_from_json(const nlohmann::json& item,
                                                         std::string& error) {
    SemanticDetails sem;
    std::string fact_type;
    if (!require_string(item, "fact_type", fact_type, error)) return std::nullopt;
    if (!require_string(item, "subject", sem.subject, error)) return std::nullopt;
    if (!require_number(item, "confidence", sem.confidence, error)) return std::nullopt;

    auto parsed = fact_type_from_string(fact_type);
    if (!parsed) {
        error = "unknown fact_type '" + fact_type + "'";
        return std::nullopt;
    }
    sem.fact_type = *parsed;
    sem.source = optional_string(item, "source");
    return sem;
}

std::optional<MemoryRecord> record_from_json(const nlohmann::json& item, std::string& error) {
    if (!item.is_object()) {
        error = "record is not an object";
        return std::nullopt;
    }

    MemoryRecord record;
    std::string kind_name;
    std::string created_at;
    if (!require_string(item, "id", record.id, error)) return std::nullopt;
    if (!require_string(item, "kind", kind_name, error)) return std::nullopt;
    if (!require_string(item, "text", record.text, error)) return std::nullopt;
    if (!require_string(item, "owner_id", record.owner_id, error)) return std::nullopt;
    if (!require_string(item, "created_at", created_at, error)) return std::nullopt;

    if (record.id.empty()) {
        error = "empty id";
        return std::nullopt;
    }
    if (record.owner_id.empty()) {
        error = "empty owner_id";
        return std::nullopt;
    }

    auto ts = parse_iso8601(created_at);
    if (!ts) {
        error = "bad created_at '" + created_at + "'";
        return std::nullopt;
    }
    record.created_at = *ts;

    auto kind = kind_from_string(kind_name);
    if (!kind) {
        error = "unknown kind '" + kind_name + "'";
        return std::nullopt;
    }

    if (*kind == MemoryKind::Episodic) {
        auto ep = episodic_from_json(item, error);
        if (!ep) return std::nullopt;
        record.details = std::move(*ep);
    } else {
        auto sem = semantic_from_json(item, error);
        if (!sem) return std::nullopt;
        record.details = std::move(*sem);
    }

    auto emb = item.find("embedding");
    if (emb != item.end() && emb->is_array()) {
        Embedding vec;
        vec.reserve(emb->size());
        bool valid = true;
        for (const auto& v : *emb) {
            if (!v.is_number() || !representable_as_float(v.get<double>())) {
                valid = false;
                break;
            }
            vec.push_back(static_cast<float>(v.get<double>()));
        }
        if (valid) record.embedding = std::move(vec);
    }

    return record;
}

} // namespace taleweave
