#pragma once
#include "../memory.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace taleweave {

struct MemoryConfig; // forward declaration

// Thrown when an archive exists but cannot be read as a whole
// (not a JSON document, not a SQLite database, unknown layout).
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Records read back from an archive. Malformed records are skipped
// individually and described in `diagnostics`.
struct ArchiveSnapshot {
    std::vector<MemoryRecord> records;
    uint32_t skipped = 0;
    std::vector<std::string> diagnostics;
};

// Durable storage for the full record set.
class MemoryArchive {
public:
    virtual ~MemoryArchive() = default;

    virtual std::string backend_name() const = 0;
    virtual const std::string& path() const = 0;

    // Replace the archive with `records`. Must be atomic with respect to a
    // crash: afterwards the archive holds either the old or the new set.
    // Returns false (after logging) on I/O failure.
    virtual bool write(const std::vector<MemoryRecord>& records, bool include_embeddings) = 0;

    // Read every record. A missing archive is an empty snapshot.
    // Throws ArchiveError if the archive is unreadable.
    virtual ArchiveSnapshot read() = 0;
};

// Create the archive backend named by cfg.backend ("json" or "sqlite") at
// `path`. Unknown backends fall back to "json".
std::unique_ptr<MemoryArchive> create_archive(const MemoryConfig& cfg, const std::string& path);

} // namespace taleweave
