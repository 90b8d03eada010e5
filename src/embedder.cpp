#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace taleweave {

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const Config& config,
                                                             HttpClient& http) {
    const auto& emb = config.embeddings;

    // Resolve provider: explicit config, or auto-detect from an API key
    std::string provider = emb.provider;
    if (provider.empty() && !emb.api_key.empty()) {
        provider = "openai";
        std::cerr << "[embedder] Found OpenAI API key, enabling embeddings\n";
    }
    if (provider.empty() || provider == "none") {
        return std::make_unique<NoopEmbedding>();
    }

    if (provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return std::make_unique<NoopEmbedding>();
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, emb.model,
                                      emb.timeout_seconds);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model, emb.timeout_seconds);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return std::make_unique<NoopEmbedding>();
}

} // namespace taleweave
