#include "similarity_index.hpp"
#include "vector.hpp"
#include <algorithm>

namespace taleweave {

namespace {

struct Candidate {
    const std::string* id;
    double score;
    Timestamp created_at;
};

bool candidate_before(const Candidate& a, const Candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return *a.id < *b.id;
}

std::vector<ScoredId> take_top(std::vector<Candidate>& candidates, size_t k) {
    size_t n = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<ptrdiff_t>(n),
                      candidates.end(), candidate_before);

    std::vector<ScoredId> result;
    result.reserve(n);
    for (size_t i = 0; i < n; i++) {
        result.push_back({*candidates[i].id, candidates[i].score});
    }
    return result;
}

} // namespace

bool SimilarityIndex::accepts(const Embedding& vector) {
    if (vector.empty()) return false;
    if (dimensions_ == 0) {
        dimensions_ = static_cast<uint32_t>(vector.size());
        return true;
    }
    return vector.size() == dimensions_;
}

bool SimilarityIndex::in_scope(const Entry& entry, const std::string& owner) {
    return owner.empty() || entry.owner_id == owner || entry.owner_id == kAllAgents;
}

bool SimilarityIndex::insert(const std::string& id, const Embedding& vector,
                             const std::string& owner_id, Timestamp created_at) {
    Entry entry;
    entry.owner_id = owner_id;
    entry.created_at = created_at;
    bool accepted = accepts(vector);
    if (accepted) entry.vector = vector;
    entries_[id] = std::move(entry);
    return accepted;
}

bool SimilarityIndex::set_vector(const std::string& id, const Embedding& vector) {
    auto it = entries_.find(id);
    if (it == entries_.end() || !accepts(vector)) return false;
    it->second.vector = vector;
    return true;
}

bool SimilarityIndex::remove(const std::string& id) {
    return entries_.erase(id) > 0;
}

void SimilarityIndex::clear() {
    entries_.clear();
}

bool SimilarityIndex::has_vector(const std::string& id) const {
    auto it = entries_.find(id);
    return it != entries_.end() && !it->second.vector.empty();
}

size_t SimilarityIndex::vector_count() const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& kv) { return !kv.second.vector.empty(); }));
}

std::vector<ScoredId> SimilarityIndex::query(const Embedding& vector,
                                             const std::string& owner,
                                             size_t k) const {
    if (vector.empty()) return query_recent(owner, k);
    if (k == 0 || vector.size() != dimensions_) return {};

    std::vector<Candidate> candidates;
    candidates.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        if (entry.vector.empty() || !in_scope(entry, owner)) continue;
        candidates.push_back({&id, cosine_similarity(vector, entry.vector), entry.created_at});
    }
    return take_top(candidates, k);
}

std::vector<ScoredId> SimilarityIndex::query_recent(const std::string& owner, size_t k) const {
    if (k == 0) return {};

    std::vector<Candidate> candidates;
    candidates.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        if (!in_scope(entry, owner)) continue;
        candidates.push_back({&id, 0.0, entry.created_at});
    }
    return take_top(candidates, k);
}

} // namespace taleweave
