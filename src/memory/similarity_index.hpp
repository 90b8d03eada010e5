#pragma once
#include "../memory.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace taleweave {

struct ScoredId {
    std::string id;
    double score = 0.0;  // cosine similarity in [-1,1]; 0 for recency results
};

// Brute-force cosine index over (id -> vector), scoped by owner.
//
// Every record is registered, with or without a vector. Records whose
// vector is missing or has the wrong dimensionality only take part in the
// recency fallback. Dimensionality is fixed at construction, or by the
// first accepted vector when constructed with 0.
class SimilarityIndex {
public:
    explicit SimilarityIndex(uint32_t dimensions = 0) : dimensions_(dimensions) {}

    uint32_t dimensions() const { return dimensions_; }

    // Register id (replacing any previous registration). Returns true if the
    // vector was accepted for similarity ranking.
    bool insert(const std::string& id, const Embedding& vector,
                const std::string& owner_id, Timestamp created_at);

    // Attach a vector to an already registered id.
    bool set_vector(const std::string& id, const Embedding& vector);

    bool remove(const std::string& id);
    void clear();

    bool contains(const std::string& id) const { return entries_.count(id) > 0; }
    bool has_vector(const std::string& id) const;
    size_t size() const { return entries_.size(); }
    size_t vector_count() const;

    // Top-k ids by cosine similarity to `vector`, best first; ties go to the
    // most recent record. An empty `vector` selects the recency fallback.
    // An empty owner disables scoping; otherwise only records owned by
    // `owner` or by kAllAgents are returned.
    std::vector<ScoredId> query(const Embedding& vector, const std::string& owner,
                                size_t k) const;

    // Fallback ordering: most recent first, same scoping rules.
    std::vector<ScoredId> query_recent(const std::string& owner, size_t k) const;

private:
    struct Entry {
        Embedding vector;  // empty = not rankable by similarity
        std::string owner_id;
        Timestamp created_at = 0;
    };

    bool accepts(const Embedding& vector);
    static bool in_scope(const Entry& entry, const std::string& owner);

    uint32_t dimensions_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace taleweave
