#include "memory_store.hpp"
#include "vector.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace taleweave {

static bool recalled_before(const RecalledMemory& a, const RecalledMemory& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.record.created_at != b.record.created_at) {
        return a.record.created_at > b.record.created_at;
    }
    return a.record.id < b.record.id;
}

MemoryStore::MemoryStore(const MemoryConfig& config, const std::string& path,
                         EmbeddingProvider* provider)
    : MemoryStore(config, create_archive(config, path), provider) {}

MemoryStore::MemoryStore(const MemoryConfig& config, std::unique_ptr<MemoryArchive> archive,
                         EmbeddingProvider* provider)
    : config_(config)
    , decay_(config.prune_threshold, config.weak_threshold)
    , archive_(std::move(archive))
    , provider_(provider ? provider : &noop_embedding_)
    , clock_([] { return static_cast<Timestamp>(epoch_seconds()); })
{
    if (!archive_) {
        throw std::invalid_argument("MemoryStore requires an archive");
    }
    if (!provider_->available()) {
        std::cerr << "[memory] No embedding provider, ranking memories by recency\n";
    }
}

void MemoryStore::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

bool MemoryStore::embeddings_enabled() const {
    return provider_->available() && !embeddings_suspended_;
}

Embedding MemoryStore::try_embed(const std::string& text) {
    if (!embeddings_enabled()) return {};

    Embedding vec = provider_->embed(text);
    if (vec.empty()) {
        if (!embed_failure_logged_.exchange(true)) {
            std::cerr << "[memory] Embedding provider '" << provider_->name()
                      << "' failed, falling back to recency ranking\n";
        }
        if (config_.suspend_embeddings_on_failure) {
            embeddings_suspended_ = true;
        }
    }
    return vec;
}

void MemoryStore::rebuild_index() {
    id_index_.clear();
    id_index_.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        id_index_[records_[i].id] = i;
    }
}

void MemoryStore::insert_locked(MemoryRecord record) {
    if (!index_.insert(record.id, record.embedding, record.owner_id, record.created_at) &&
        !record.embedding.empty()) {
        std::cerr << "[memory] " << record.id << ": embedding has " << record.embedding.size()
                  << " dimensions, index expects " << index_.dimensions()
                  << "; ranking it by recency only\n";
        record.embedding.clear();
    }
    id_index_[record.id] = records_.size();
    records_.push_back(std::move(record));
}

bool MemoryStore::remove_locked(const std::string& id) {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return false;

    records_.erase(records_.begin() + static_cast<ptrdiff_t>(it->second));
    index_.remove(id);
    rebuild_index();
    return true;
}

std::string MemoryStore::add(MemoryRecord record) {
    if (record.owner_id.empty()) {
        throw std::invalid_argument("memory owner_id must be non-empty");
    }
    normalize_record(record);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record.id.empty()) {
            do {
                record.id = generate_memory_id();
            } while (id_index_.count(record.id));
        } else if (id_index_.count(record.id)) {
            throw DuplicateIdError(record.id);
        }
    }

    // Compute embedding OUTSIDE the mutex (HTTP call may be slow)
    if (record.embedding.empty()) {
        record.embedding = try_embed(record.text);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (id_index_.count(record.id)) {
        throw DuplicateIdError(record.id);
    }
    std::string id = record.id;
    insert_locked(std::move(record));
    return id;
}

bool MemoryStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_locked(id);
}

std::optional<MemoryRecord> MemoryStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = id_index_.find(id);
    if (it != id_index_.end()) return records_[it->second];
    return std::nullopt;
}

RecalledMemory MemoryStore::recall_entry(const MemoryRecord& record, Timestamp now) const {
    RecalledMemory entry;
    entry.record = record;
    if (const auto* sem = record.semantic()) {
        entry.strength = sem->confidence;
    } else {
        entry.strength = decay_.strength(record, now);
    }
    return entry;
}

std::vector<RecalledMemory> MemoryStore::retrieve_by_similarity(
    const std::string& query_text, const std::string& owner_id, uint32_t limit,
    std::optional<MemoryKind> kind_filter) {
    if (limit == 0) return {};

    bool rankable = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rankable = index_.vector_count() > 0;
    }

    Embedding query_vec;
    if (rankable) {
        query_vec = try_embed(query_text);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_();

    bool fallback = query_vec.empty() || query_vec.size() != index_.dimensions();
    auto candidates = fallback ? index_.query_recent(owner_id, index_.size())
                               : index_.query(query_vec, owner_id, index_.size());

    std::vector<RecalledMemory> results;
    for (const auto& candidate : candidates) {
        auto it = id_index_.find(candidate.id);
        if (it == id_index_.end()) continue;
        const auto& record = records_[it->second];

        if (kind_filter && record.kind() != *kind_filter) continue;
        if (decay_.should_prune(record, now)) continue;

        RecalledMemory entry = recall_entry(record, now);
        double rank_strength = record.episodic() ? entry.strength : 1.0;
        entry.similarity = fallback ? 0.0 : normalized_similarity(candidate.score);
        entry.score = entry.similarity * config_.similarity_weight +
                      rank_strength * config_.strength_weight;
        results.push_back(std::move(entry));

        // Recency order is already final
        if (fallback && results.size() >= limit) break;
    }

    if (!fallback) {
        std::stable_sort(results.begin(), results.end(), recalled_before);
    }
    if (results.size() > limit) results.resize(limit);
    return results;
}

std::vector<RecalledMemory> MemoryStore::retrieve_by_importance(const std::string& owner_id,
                                                                double min_importance,
                                                                uint32_t limit) const {
    if (limit == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_();

    std::vector<RecalledMemory> results;
    for (const auto& record : records_) {
        if (!record.visible_to(owner_id)) continue;

        if (const auto* ep = record.episodic()) {
            if (ep->importance < min_importance) continue;
            if (decay_.should_prune(record, now)) continue;
            RecalledMemory entry = recall_entry(record, now);
            entry.score = ep->importance;
            results.push_back(std::move(entry));
        } else if (const auto* sem = record.semantic()) {
            if (sem->confidence < min_importance) continue;
            RecalledMemory entry = recall_entry(record, now);
            entry.score = sem->confidence;
            results.push_back(std::move(entry));
        }
    }

    size_t k = std::min(static_cast<size_t>(limit), results.size());
    std::partial_sort(results.begin(), results.begin() + static_cast<ptrdiff_t>(k),
                      results.end(), recalled_before);
    results.resize(k);
    return results;
}

DecayReport MemoryStore::decay_and_prune_locked(Timestamp now) {
    DecaySweep sweep = decay_.sweep(records_, now);

    DecayReport report;
    report.examined = static_cast<uint32_t>(records_.size());
    report.active = sweep.active;
    report.weak = sweep.weak;
    report.pruned_ids = std::move(sweep.pruned_ids);

    if (!report.pruned_ids.empty()) {
        std::unordered_set<std::string> doomed(report.pruned_ids.begin(),
                                               report.pruned_ids.end());
        records_.erase(std::remove_if(records_.begin(), records_.end(),
            [&doomed](const MemoryRecord& r) { return doomed.count(r.id) > 0; }),
            records_.end());
        for (const auto& id : report.pruned_ids) {
            index_.remove(id);
        }
        rebuild_index();
        std::cerr << "[memory] Pruned " << report.pruned_ids.size() << " weak memories\n";
    }
    return report;
}

DecayReport MemoryStore::decay_and_prune(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return decay_and_prune_locked(now);
}

std::vector<MemoryRecord> MemoryStore::list_all(const std::string& owner_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MemoryRecord> result;
    for (const auto& record : records_) {
        if (record.visible_to(owner_id)) result.push_back(record);
    }
    return result;
}

bool MemoryStore::persist_locked() {
    bool written = false;
    try {
        written = archive_->write(records_, config_.persist_embeddings);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[memory] Could not encode memories for " << archive_->path() << ": "
                  << e.what() << "\n";
    }
    if (!written) {
        std::cerr << "[memory] Failed to persist " << records_.size() << " memories to "
                  << archive_->path() << "; session continues unsaved\n";
        return false;
    }
    return true;
}

bool MemoryStore::persist() {
    std::lock_guard<std::mutex> lock(mutex_);
    return persist_locked();
}

LoadResult MemoryStore::load() {
    LoadResult result;

    ArchiveSnapshot snapshot;
    try {
        snapshot = archive_->read();
    } catch (const ArchiveError& e) {
        std::cerr << "[memory] Load failed: " << e.what() << "\n";
        result.ok = false;
        result.error = e.what();
        return result;
    }

    result.skipped = snapshot.skipped;
    result.diagnostics = std::move(snapshot.diagnostics);

    std::vector<MemoryRecord> records;
    records.reserve(snapshot.records.size());
    std::unordered_set<std::string> seen;
    for (auto& record : snapshot.records) {
        if (!seen.insert(record.id).second) {
            result.skipped++;
            result.diagnostics.push_back("duplicate id '" + record.id + "'");
            continue;
        }
        normalize_record(record);
        records.push_back(std::move(record));
    }
    for (const auto& diag : result.diagnostics) {
        std::cerr << "[archive] Skipped " << diag << "\n";
    }

    // Recompute missing vectors; stored fields and ids stay as loaded
    if (config_.reembed_on_load && embeddings_enabled()) {
        for (auto& record : records) {
            if (!record.embedding.empty()) continue;
            record.embedding = try_embed(record.text);
            if (record.embedding.empty()) break;
            result.reembedded++;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    id_index_.clear();
    index_ = SimilarityIndex();
    for (auto& record : records) {
        insert_locked(std::move(record));
    }
    result.loaded = static_cast<uint32_t>(records_.size());

    std::cerr << "[memory] Loaded " << result.loaded << " memories from " << archive_->path();
    if (result.skipped > 0) std::cerr << " (" << result.skipped << " skipped)";
    std::cerr << "\n";
    return result;
}

TurnReport MemoryStore::end_turn(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    TurnReport report;
    report.turn = ++turn_;
    if (config_.decay_interval > 0 && turn_ % config_.decay_interval == 0) {
        report.decay = decay_and_prune_locked(now);
    }
    if (config_.persist_interval > 0 && turn_ % config_.persist_interval == 0) {
        report.persisted = persist_locked();
    }
    return report;
}

uint32_t MemoryStore::backfill_embeddings() {
    if (!embeddings_enabled()) return 0;

    std::vector<std::pair<std::string, std::string>> missing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (!index_.has_vector(record.id)) missing.emplace_back(record.id, record.text);
        }
    }

    uint32_t embedded = 0;
    for (const auto& [id, text] : missing) {
        Embedding vec = try_embed(text);
        if (vec.empty()) break;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = id_index_.find(id);
        if (it == id_index_.end()) continue;
        if (index_.set_vector(id, vec)) {
            records_[it->second].embedding = std::move(vec);
            embedded++;
        }
    }
    return embedded;
}

MemoryStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MemoryStats s;
    s.total = static_cast<uint32_t>(records_.size());
    for (const auto& record : records_) {
        if (record.episodic()) s.episodic++;
        else s.semantic++;
    }
    s.with_embedding = static_cast<uint32_t>(index_.vector_count());
    s.provider = provider_->name();
    s.provider_available = embeddings_enabled();
    return s;
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace taleweave
