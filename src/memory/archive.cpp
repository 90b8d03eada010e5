#include "archive.hpp"
#include "json_archive.hpp"
#include "sqlite_archive.hpp"
#include "../config.hpp"
#include <iostream>

namespace taleweave {

std::unique_ptr<MemoryArchive> create_archive(const MemoryConfig& cfg, const std::string& path) {
    if (cfg.backend == "sqlite") {
        return std::make_unique<SqliteArchive>(path);
    }
    if (cfg.backend != "json") {
        std::cerr << "[archive] Unknown backend '" << cfg.backend << "', using json\n";
    }
    return std::make_unique<JsonArchive>(path);
}

} // namespace taleweave
