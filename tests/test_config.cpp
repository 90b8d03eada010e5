#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <iterator>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace taleweave;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.memory.backend == "json");
    REQUIRE(cfg.memory.prune_threshold == 0.1);
    REQUIRE(cfg.memory.weak_threshold == 0.3);
    REQUIRE(cfg.memory.similarity_weight == 0.6);
    REQUIRE(cfg.memory.strength_weight == 0.4);
    REQUIRE(cfg.memory.persist_embeddings);
    REQUIRE_FALSE(cfg.memory.suspend_embeddings_on_failure);
    REQUIRE(cfg.embeddings.provider.empty());
    REQUIRE(cfg.embeddings.timeout_seconds == 10);
}

TEST_CASE("Config::defaults_json: matches struct defaults", "[config]") {
    Config from_defaults = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(from_defaults.memory.backend == plain.memory.backend);
    REQUIRE(from_defaults.memory.decay_interval == plain.memory.decay_interval);
    REQUIRE(from_defaults.memory.persist_interval == plain.memory.persist_interval);
    REQUIRE(from_defaults.memory.reembed_on_load == plain.memory.reembed_on_load);
    REQUIRE(from_defaults.embeddings.timeout_seconds == plain.embeddings.timeout_seconds);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": {
            "backend": "sqlite",
            "path": "/var/lib/taleweave/npc.db",
            "prune_threshold": 0.05,
            "weak_threshold": 0.25,
            "similarity_weight": 0.7,
            "strength_weight": 0.3,
            "decay_interval": 10,
            "persist_interval": 3,
            "persist_embeddings": false,
            "reembed_on_load": false,
            "suspend_embeddings_on_failure": true
        },
        "embeddings": {
            "provider": "ollama",
            "base_url": "http://gpu-box:11434",
            "model": "mxbai-embed-large",
            "timeout_seconds": 3
        }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.backend == "sqlite");
    REQUIRE(cfg.memory.path == "/var/lib/taleweave/npc.db");
    REQUIRE(cfg.memory.prune_threshold == 0.05);
    REQUIRE(cfg.memory.weak_threshold == 0.25);
    REQUIRE(cfg.memory.similarity_weight == 0.7);
    REQUIRE(cfg.memory.strength_weight == 0.3);
    REQUIRE(cfg.memory.decay_interval == 10);
    REQUIRE(cfg.memory.persist_interval == 3);
    REQUIRE_FALSE(cfg.memory.persist_embeddings);
    REQUIRE_FALSE(cfg.memory.reembed_on_load);
    REQUIRE(cfg.memory.suspend_embeddings_on_failure);
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.base_url == "http://gpu-box:11434");
    REQUIRE(cfg.embeddings.model == "mxbai-embed-large");
    REQUIRE(cfg.embeddings.timeout_seconds == 3);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": {"backend": 7, "prune_threshold": "high", "decay_interval": -2},
        "embeddings": "openai"
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.backend == "json");
    REQUIRE(cfg.memory.prune_threshold == 0.1);
    REQUIRE(cfg.memory.decay_interval == 5);
    REQUIRE(cfg.embeddings.provider.empty());
}

// ── memory_path ──────────────────────────────────────────────────

TEST_CASE("Config::memory_path: explicit path wins", "[config]") {
    Config cfg;
    cfg.memory.path = "/srv/memory.json";
    REQUIRE(cfg.memory_path() == "/srv/memory.json");
}

TEST_CASE("Config::memory_path: default depends on backend", "[config]") {
    Config cfg;
    std::string json_path = cfg.memory_path();
    REQUIRE(json_path.size() >= 23);
    REQUIRE(json_path.substr(json_path.size() - 23) == "/.taleweave/memory.json");

    cfg.memory.backend = "sqlite";
    std::string db_path = cfg.memory_path();
    REQUIRE(db_path.substr(db_path.size() - 21) == "/.taleweave/memory.db");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "taleweave_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TALEWEAVE_MEMORY_PATH");
        unsetenv("TALEWEAVE_EMBEDDINGS_PROVIDER");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.taleweave/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.taleweave");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "memory": {"backend": "sqlite", "prune_threshold": 0.2},
        "embeddings": {"provider": "openai", "api_key": "sk-file"}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.backend == "sqlite");
    REQUIRE(cfg.memory.prune_threshold == 0.2);
    REQUIRE(cfg.embeddings.provider == "openai");
    REQUIRE(cfg.embeddings.api_key == "sk-file");
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"memory": {"decay_interval": 1}})";
    }

    Config cfg = Config::load(path);
    REQUIRE(cfg.memory.decay_interval == 1);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.backend == "json");
    REQUIRE(cfg.embeddings.api_key.empty());
    // Malformed file is left for the user to fix
    REQUIRE(g.read_config() == "not valid json {{{");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "memory": {"path": "/from/file.json"},
        "embeddings": {"provider": "none"}
    })");
    setenv("TALEWEAVE_MEMORY_PATH", "/from/env.json", 1);
    setenv("TALEWEAVE_EMBEDDINGS_PROVIDER", "ollama", 1);
    setenv("OLLAMA_BASE_URL", "http://env:1234", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.memory.path == "/from/env.json");
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.base_url == "http://env:1234");

    unsetenv("TALEWEAVE_MEMORY_PATH");
    unsetenv("TALEWEAVE_EMBEDDINGS_PROVIDER");
    unsetenv("OLLAMA_BASE_URL");
}

TEST_CASE("Config::load: OPENAI_API_KEY fills only an empty key", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    setenv("OPENAI_API_KEY", "sk-env", 1);

    SECTION("no key in file") {
        Config cfg = Config::load();
        REQUIRE(cfg.embeddings.api_key == "sk-env");
    }
    SECTION("key in file") {
        g.write_config(R"({"embeddings": {"api_key": "sk-file"}})");
        Config cfg = Config::load();
        REQUIRE(cfg.embeddings.api_key == "sk-file");
    }

    unsetenv("OPENAI_API_KEY");
}

TEST_CASE("Config::load: OLLAMA_BASE_URL ignored for other providers", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"embeddings": {"provider": "openai", "base_url": "https://proxy/v1"}})");
    setenv("OLLAMA_BASE_URL", "http://env:1234", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.base_url == "https://proxy/v1");

    unsetenv("OLLAMA_BASE_URL");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j.contains("memory"));
    REQUIRE(j["memory"]["backend"] == "json");
    REQUIRE(j["memory"]["prune_threshold"] == 0.1);
    REQUIRE(j.contains("embeddings"));
    REQUIRE(j["embeddings"]["provider"] == "");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"memory": {"backend": "sqlite"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.backend == "sqlite");

    // Re-read file to verify migration wrote new keys
    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["memory"]["backend"] == "sqlite");
    REQUIRE(j["memory"]["decay_interval"] == 5);
    REQUIRE(j.contains("embeddings"));
    REQUIRE(j["embeddings"]["timeout_seconds"] == 10);
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["memory"]["backend"] = "sqlite";
    full["memory"]["persist_interval"] = 2;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();

    REQUIRE(cfg.memory.backend == "sqlite");
    REQUIRE(cfg.memory.persist_interval == 2);
    REQUIRE(before == g.read_config());
}
