#pragma once
#include "archive.hpp"
#include <string>

namespace taleweave {

// SQLite database with one row per record in insertion order.
// write() builds a fresh database at <path>.tmp inside one transaction and
// renames it over <path>.
class SqliteArchive : public MemoryArchive {
public:
    explicit SqliteArchive(std::string path) : path_(std::move(path)) {}

    std::string backend_name() const override { return "sqlite"; }
    const std::string& path() const override { return path_; }

    bool write(const std::vector<MemoryRecord>& records, bool include_embeddings) override;
    ArchiveSnapshot read() override;

private:
    std::string path_;
};

} // namespace taleweave
