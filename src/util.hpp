#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace taleweave {

// Seconds since the Unix epoch, UTC.
using Timestamp = int64_t;

// Unix epoch seconds
uint64_t epoch_seconds();

// ISO 8601 UTC timestamp, e.g. "2024-05-01T12:30:00Z"
std::string format_iso8601(Timestamp ts);

// Parse "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" suffix. No suffix means UTC.
std::optional<Timestamp> parse_iso8601(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path + ".tmp", fsync, then rename over path.
// Readers see either the old file or the complete new one.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace taleweave
