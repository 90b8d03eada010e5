#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace taleweave {

// Shared JSON <-> MemoryRecord conversion used by both archive backends.

nlohmann::json record_to_json(const MemoryRecord& record, bool include_embedding = true);

// Returns std::nullopt and a reason in `error` when `item` is not a valid
// record: unknown kind, or a required field for its kind missing/mistyped.
// A malformed "embedding" is dropped rather than rejecting the record.
std::optional<MemoryRecord> record_from_json(const nlohmann::json& item, std::string& error);

} // namespace taleweave
