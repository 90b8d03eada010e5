#pragma once
#include "archive.hpp"
#include <string>

namespace taleweave {

// Single JSON document: {"version":1,"saved_at":...,"memories":[...]}
class JsonArchive : public MemoryArchive {
public:
    static constexpr int kFormatVersion = 1;

    explicit JsonArchive(std::string path) : path_(std::move(path)) {}

    std::string backend_name() const override { return "json"; }
    const std::string& path() const override { return path_; }

    bool write(const std::vector<MemoryRecord>& records, bool include_embeddings) override;
    ArchiveSnapshot read() override;

private:
    std::string path_;
};

} // namespace taleweave
