#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace taleweave {

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"backend", "json"},
            {"path", ""},
            {"prune_threshold", 0.1},
            {"weak_threshold", 0.3},
            {"similarity_weight", 0.6},
            {"strength_weight", 0.4},
            {"decay_interval", 5},
            {"persist_interval", 5},
            {"persist_embeddings", true},
            {"reembed_on_load", true},
            {"suspend_embeddings_on_failure", false}
        }},
        {"embeddings", {
            {"provider", ""},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""},
            {"timeout_seconds", 10}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("backend") && m["backend"].is_string())
            cfg.memory.backend = m["backend"].get<std::string>();
        if (m.contains("path") && m["path"].is_string())
            cfg.memory.path = m["path"].get<std::string>();
        if (m.contains("prune_threshold") && m["prune_threshold"].is_number())
            cfg.memory.prune_threshold = m["prune_threshold"].get<double>();
        if (m.contains("weak_threshold") && m["weak_threshold"].is_number())
            cfg.memory.weak_threshold = m["weak_threshold"].get<double>();
        if (m.contains("similarity_weight") && m["similarity_weight"].is_number())
            cfg.memory.similarity_weight = m["similarity_weight"].get<double>();
        if (m.contains("strength_weight") && m["strength_weight"].is_number())
            cfg.memory.strength_weight = m["strength_weight"].get<double>();
        if (m.contains("decay_interval") && m["decay_interval"].is_number_unsigned())
            cfg.memory.decay_interval = m["decay_interval"].get<uint32_t>();
        if (m.contains("persist_interval") && m["persist_interval"].is_number_unsigned())
            cfg.memory.persist_interval = m["persist_interval"].get<uint32_t>();
        if (m.contains("persist_embeddings") && m["persist_embeddings"].is_boolean())
            cfg.memory.persist_embeddings = m["persist_embeddings"].get<bool>();
        if (m.contains("reembed_on_load") && m["reembed_on_load"].is_boolean())
            cfg.memory.reembed_on_load = m["reembed_on_load"].get<bool>();
        if (m.contains("suspend_embeddings_on_failure") &&
            m["suspend_embeddings_on_failure"].is_boolean())
            cfg.memory.suspend_embeddings_on_failure =
                m["suspend_embeddings_on_failure"].get<bool>();
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embeddings.api_key = e["api_key"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embeddings.base_url = e["base_url"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embeddings.model = e["model"].get<std::string>();
        if (e.contains("timeout_seconds") && e["timeout_seconds"].is_number_unsigned())
            cfg.embeddings.timeout_seconds = e["timeout_seconds"].get<long>();
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? expand_home("~/.taleweave/config.json") : path;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original && atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("TALEWEAVE_MEMORY_PATH"))
        cfg.memory.path = v;
    if (const char* v = std::getenv("TALEWEAVE_EMBEDDINGS_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        if (cfg.embeddings.api_key.empty()) cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }

    return cfg;
}

std::string Config::memory_path() const {
    if (!memory.path.empty()) return expand_home(memory.path);
    if (memory.backend == "sqlite") return expand_home("~/.taleweave/memory.db");
    return expand_home("~/.taleweave/memory.json");
}

} // namespace taleweave
