#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include "../embedder.hpp"
#include "archive.hpp"
#include "decay.hpp"
#include "similarity_index.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace taleweave {

// Thrown by MemoryStore::add() when the id is already present.
class DuplicateIdError : public std::runtime_error {
public:
    explicit DuplicateIdError(const std::string& id)
        : std::runtime_error("duplicate memory id: " + id), id_(id) {}
    const std::string& id() const { return id_; }

private:
    std::string id_;
};

struct DecayReport {
    uint32_t examined = 0;
    uint32_t active = 0;
    uint32_t weak = 0;
    std::vector<std::string> pruned_ids;
};

struct LoadResult {
    bool ok = true;
    std::string error;          // set when ok == false
    uint32_t loaded = 0;
    uint32_t skipped = 0;       // malformed or duplicate records
    uint32_t reembedded = 0;
    std::vector<std::string> diagnostics;
};

struct TurnReport {
    uint64_t turn = 0;
    std::optional<DecayReport> decay;  // set when decay ran this turn
    std::optional<bool> persisted;     // set when persist ran this turn
};

struct MemoryStats {
    uint32_t total = 0;
    uint32_t episodic = 0;
    uint32_t semantic = 0;
    uint32_t with_embedding = 0;
    std::string provider;
    bool provider_available = false;
};

// Per-session store of agent memories.
//
// Owns the record table, the similarity index and the archive. The
// embedding provider is borrowed and must outlive the store; without one
// the store ranks by recency. Strength is never stored: it is computed
// from the record and a timestamp whenever it is needed.
class MemoryStore {
public:
    using Clock = std::function<Timestamp()>;

    MemoryStore(const MemoryConfig& config, const std::string& path,
                EmbeddingProvider* provider = nullptr);
    MemoryStore(const MemoryConfig& config, std::unique_ptr<MemoryArchive> archive,
                EmbeddingProvider* provider = nullptr);

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // Insert a record. Values are clamped into range and an empty id is
    // replaced by a generated one. Returns the id.
    // Throws DuplicateIdError if the id is taken (store unchanged) and
    // std::invalid_argument if owner_id is empty.
    std::string add(MemoryRecord record);

    // Remove a record from table and index. Returns false if absent.
    bool remove(const std::string& id);

    std::optional<MemoryRecord> get(const std::string& id) const;

    // Best `limit` records for owner (plus shared records) ranked by
    //   score = similarity * similarity_weight + strength * strength_weight
    // where similarity is normalized cosine in [0,1] and semantic strength
    // is 1. Episodic records below the prune threshold are excluded. When no
    // query vector is available the ranking falls back to most recent first.
    std::vector<RecalledMemory> retrieve_by_similarity(
        const std::string& query_text, const std::string& owner_id, uint32_t limit,
        std::optional<MemoryKind> kind_filter = std::nullopt);

    // Episodic records with importance >= min_importance that have not
    // faded below the prune threshold, and semantic records with
    // confidence >= min_importance, by importance/confidence descending.
    std::vector<RecalledMemory> retrieve_by_importance(const std::string& owner_id,
                                                       double min_importance,
                                                       uint32_t limit) const;

    // Remove every episodic record whose strength at `now` is below the
    // prune threshold. Semantic records are never removed.
    DecayReport decay_and_prune(Timestamp now);

    // All records visible to owner (empty = every record), insertion order.
    std::vector<MemoryRecord> list_all(const std::string& owner_id) const;

    // Write every record to the archive. On failure the in-memory state is
    // untouched and false is returned.
    bool persist();

    // Replace the in-memory state with the archive contents.
    LoadResult load();

    // Turn-boundary maintenance: decay every decay_interval turns and
    // persist every persist_interval turns.
    TurnReport end_turn(Timestamp now);

    // Embed records that have no vector. Returns how many were embedded.
    uint32_t backfill_embeddings();

    MemoryStats stats() const;
    size_t size() const;

    const DecayEngine& decay_engine() const { return decay_; }
    const MemoryArchive& archive() const { return *archive_; }

    // Time source for retrieval-time strength. Defaults to the wall clock.
    void set_clock(Clock clock);

private:
    Embedding try_embed(const std::string& text);
    bool embeddings_enabled() const;
    void insert_locked(MemoryRecord record);
    bool remove_locked(const std::string& id);
    void rebuild_index();
    DecayReport decay_and_prune_locked(Timestamp now);
    bool persist_locked();
    RecalledMemory recall_entry(const MemoryRecord& record, Timestamp now) const;

    MemoryConfig config_;
    DecayEngine decay_;
    std::unique_ptr<MemoryArchive> archive_;

    NoopEmbedding noop_embedding_;
    EmbeddingProvider* provider_;
    std::atomic<bool> embed_failure_logged_{false};
    std::atomic<bool> embeddings_suspended_{false};

    std::vector<MemoryRecord> records_;
    std::unordered_map<std::string, size_t> id_index_; // id -> records_ index
    SimilarityIndex index_;
    uint64_t turn_ = 0;
    Clock clock_;

    mutable std::mutex mutex_;
};

} // namespace taleweave
