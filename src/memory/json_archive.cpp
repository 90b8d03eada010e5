#include "json_archive.hpp"
#include "record_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace taleweave {

bool JsonArchive::write(const std::vector<MemoryRecord>& records, bool include_embeddings) {
    nlohmann::json memories = nlohmann::json::array();
    for (const auto& record : records) {
        memories.push_back(record_to_json(record, include_embeddings));
    }

    nlohmann::json doc = {
        {"version", kFormatVersion},
        {"saved_at", format_iso8601(static_cast<Timestamp>(epoch_seconds()))},
        {"memories", std::move(memories)}
    };
    // Invalid UTF-8 in free text is written as U+FFFD rather than failing the save
    return atomic_write_file(path_,
                             doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

ArchiveSnapshot JsonArchive::read() {
    ArchiveSnapshot snapshot;

    std::ifstream file(path_);
    if (!file.is_open()) return snapshot;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ArchiveError("json archive " + path_ + " is not valid JSON: " + e.what());
    }

    // Bare arrays are accepted as a list of records
    const nlohmann::json* memories = nullptr;
    if (doc.is_array()) {
        memories = &doc;
    } else if (doc.is_object() && doc.contains("memories") && doc["memories"].is_array()) {
        memories = &doc["memories"];
    } else {
        throw ArchiveError("json archive " + path_ + " has no \"memories\" array");
    }

    snapshot.records.reserve(memories->size());
    size_t index = 0;
    for (const auto& item : *memories) {
        std::string error;
        auto record = record_from_json(item, error);
        if (record) {
            snapshot.records.push_back(std::move(*record));
        } else {
            snapshot.skipped++;
            snapshot.diagnostics.push_back("record " + std::to_string(index) + ": " + error);
        }
        index++;
    }
    return snapshot;
}

} // namespace taleweave
