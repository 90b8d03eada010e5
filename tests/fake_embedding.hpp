#pragma once
#include "embedder.hpp"
#include <atomic>
#include <string>
#include <unordered_map>

namespace taleweave {

// Deterministic provider: exact text -> vector, anything else gets
// fallback_vector (empty = failure).
class FakeEmbedding : public EmbeddingProvider {
public:
    std::unordered_map<std::string, Embedding> vectors;
    Embedding fallback_vector;
    bool fail = false;
    std::atomic<int> call_count{0};

    Embedding embed(const std::string& text) override {
        call_count++;
        if (fail) return {};
        auto it = vectors.find(text);
        if (it != vectors.end()) return it->second;
        return fallback_vector;
    }
    uint32_t dimensions() const override { return 3; }
    std::string name() const override { return "fake"; }
};

} // namespace taleweave
