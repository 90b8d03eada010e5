#include "config.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "memory.hpp"
#include "memory/memory_store.hpp"
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: taleweave-memctl [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  stats                    Show record counts and embedding status\n"
              << "  list OWNER               List memories visible to OWNER\n"
              << "  recall OWNER QUERY...    Rank memories by similarity to QUERY\n"
              << "  important OWNER [MIN]    Memories with importance >= MIN (default 0.5)\n"
              << "  decay [HOURS]            Prune faded memories HOURS from now, then save\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH            Config file (default ~/.taleweave/config.json)\n"
              << "  --memory PATH            Memory archive (overrides memory.path)\n"
              << "  -n N                     Result limit (default 10)\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TALEWEAVE_MEMORY_PATH          Memory archive path\n"
              << "  TALEWEAVE_EMBEDDINGS_PROVIDER  none, openai or ollama\n"
              << "  OPENAI_API_KEY                 API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL                Base URL for Ollama (default: http://localhost:11434)\n";
}

static void print_memory(const taleweave::MemoryRecord& record) {
    std::cout << record.id << "  [" << taleweave::kind_to_string(record.kind()) << "] "
              << record.owner_id << "  " << taleweave::format_iso8601(record.created_at);
    if (const auto* ep = record.episodic()) {
        std::cout << "  importance=" << ep->importance
                  << " emotion=" << taleweave::emotion_to_string(ep->emotion);
    } else if (const auto* sem = record.semantic()) {
        std::cout << "  " << taleweave::fact_type_to_string(sem->fact_type)
                  << " subject=" << sem->subject << " confidence=" << sem->confidence;
    }
    std::cout << "\n    " << record.text << "\n";
}

static void print_recalled(const std::vector<taleweave::RecalledMemory>& results) {
    if (results.empty()) {
        std::cout << "No memories.\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& r : results) {
        std::cout << "score=" << r.score << " strength=" << r.strength
                  << " similarity=" << r.similarity << "  ";
        print_memory(r.record);
    }
}

static int run_command(const std::vector<std::string>& args, uint32_t limit,
                       taleweave::MemoryStore& store) {
    const std::string& cmd = args[0];

    if (cmd == "stats") {
        auto s = store.stats();
        std::cout << "Archive: " << store.archive().path()
                  << " (" << store.archive().backend_name() << ")\n"
                  << "Memories: " << s.total << " (" << s.episodic << " episodic, "
                  << s.semantic << " semantic)\n"
                  << "With embedding: " << s.with_embedding << "\n"
                  << "Embedding provider: " << s.provider
                  << (s.provider_available ? "" : " (unavailable)") << "\n";
        return 0;
    }

    if (cmd == "list" && args.size() == 2) {
        auto records = store.list_all(args[1]);
        for (const auto& record : records) print_memory(record);
        std::cout << records.size() << " memories\n";
        return 0;
    }

    if (cmd == "recall" && args.size() >= 3) {
        std::string query;
        for (size_t i = 2; i < args.size(); i++) {
            if (!query.empty()) query += ' ';
            query += args[i];
        }
        print_recalled(store.retrieve_by_similarity(query, args[1], limit));
        return 0;
    }

    if (cmd == "important" && (args.size() == 2 || args.size() == 3)) {
        double min_importance = args.size() == 3 ? std::stod(args[2]) : 0.5;
        print_recalled(store.retrieve_by_importance(args[1], min_importance, limit));
        return 0;
    }

    if (cmd == "decay" && args.size() <= 2) {
        double hours = args.size() == 2 ? std::stod(args[1]) : 0.0;
        auto now = static_cast<taleweave::Timestamp>(taleweave::epoch_seconds()) +
                   static_cast<taleweave::Timestamp>(hours * 3600.0);
        auto report = store.decay_and_prune(now);
        std::cout << "Examined " << report.examined << ": " << report.active << " active, "
                  << report.weak << " weak, " << report.pruned_ids.size() << " pruned\n";
        for (const auto& id : report.pruned_ids) std::cout << "  pruned " << id << "\n";
        if (!store.persist()) {
            std::cerr << "Error: could not save " << store.archive().path() << "\n";
            return 1;
        }
        return 0;
    }

    std::cerr << "Invalid command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string memory_path;
    uint32_t limit = 10;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--memory") == 0 && i + 1 < argc) {
            memory_path = argv[++i];
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            limit = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (argv[i][0] == '-' && args.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    // Initialize
    taleweave::http_init();
    auto config = taleweave::Config::load(config_path);
    if (!memory_path.empty()) {
        config.memory.path = memory_path;
    }

    taleweave::CurlHttpClient http_client;
    auto embedder = taleweave::create_embedding_provider(config, http_client);
    taleweave::MemoryStore store(config.memory, config.memory_path(), embedder.get());

    auto loaded = store.load();
    if (!loaded.ok) {
        std::cerr << "Error: " << loaded.error << "\n";
        taleweave::http_cleanup();
        return 1;
    }
    if (loaded.reembedded > 0) {
        std::cerr << "[memory] Re-embedded " << loaded.reembedded << " memories\n";
    }

    int rc = run_command(args, limit, store);
    taleweave::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
