#pragma once
#include "memory.hpp"
#include <string>
#include <memory>
#include <cstdint>

namespace taleweave {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // Compute embedding vector for the given text.
    // Returns an empty vector on any failure (timeout, transport, bad reply).
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors (0 = unknown until first reply)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama", "none")
    virtual std::string name() const = 0;

    // False for providers that can never produce a vector.
    virtual bool available() const { return true; }
};

// Provider used when no embedding backend is configured.
// Callers see it as unavailable and rank by recency instead.
class NoopEmbedding : public EmbeddingProvider {
public:
    Embedding embed(const std::string&) override { return {}; }
    uint32_t dimensions() const override { return 0; }
    std::string name() const override { return "none"; }
    bool available() const override { return false; }
};

// Create an embedding provider from config. Falls back to NoopEmbedding when
// embeddings are disabled or the configured provider is not recognized.
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const Config& config,
                                                             HttpClient& http);

} // namespace taleweave
