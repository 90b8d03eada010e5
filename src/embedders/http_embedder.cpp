#include "http_embedder.hpp"
#include "../memory/vector.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace taleweave {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEmbedder::embed(const std::string& text) {
    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    HttpResponse response;
    try {
        response = http_.post(config_.base_url + config_.endpoint,
                              body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                              headers, config_.timeout_seconds);
    } catch (const std::exception& e) {
        std::cerr << "[embedder] " << config_.name << " request failed: " << e.what() << "\n";
        return {};
    }
    if (response.status_code != 200) {
        return {};
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        if (!arr.is_array() || arr.empty()) return {};

        Embedding result;
        result.reserve(arr.size());
        for (const auto& val : arr) {
            double component = val.get<double>();
            if (!representable_as_float(component)) {
                std::cerr << "[embedder] " << config_.name
                          << " returned a component outside float range\n";
                return {};
            }
            result.push_back(static_cast<float>(component));
        }
        dimensions_ = static_cast<uint32_t>(result.size());
        return result;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[embedder] " << config_.name << " returned a malformed body: "
                  << e.what() << "\n";
        return {};
    }
}

std::unique_ptr<EmbeddingProvider> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = 1536;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<EmbeddingProvider> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = 768;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace taleweave
