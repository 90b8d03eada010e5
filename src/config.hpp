#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace taleweave {

struct MemoryConfig {
    std::string backend = "json";          // "json" or "sqlite"
    std::string path;                      // empty = ~/.taleweave/memory.<ext>
    double prune_threshold = 0.1;
    double weak_threshold = 0.3;
    double similarity_weight = 0.6;
    double strength_weight = 0.4;
    uint32_t decay_interval = 5;           // run decay_and_prune every N turns (0 = never)
    uint32_t persist_interval = 5;         // persist every N turns (0 = never)
    bool persist_embeddings = true;
    bool reembed_on_load = true;
    bool suspend_embeddings_on_failure = false;
};

struct EmbeddingsConfig {
    std::string provider;                  // "", "none", "openai", "ollama"
    std::string api_key;
    std::string base_url;
    std::string model;
    long timeout_seconds = 10;
};

struct Config {
    MemoryConfig memory;
    EmbeddingsConfig embeddings;

    // Load from path (default ~/.taleweave/config.json) + env vars.
    // A missing file is created with defaults; missing keys are migrated in.
    static Config load(const std::string& path = "");

    // Parse a config document without touching the filesystem or environment.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Archive path with the backend-specific default applied.
    std::string memory_path() const;
};

} // namespace taleweave
