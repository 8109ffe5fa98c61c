#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedding_generator.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace sift {

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;
    if (emb.provider.empty() || emb.provider == "none") return nullptr;

    // Catalog model name, or the raw value when it is not a catalog key
    std::string model = emb.model;
    if (auto spec = find_provider_spec(emb.model)) model = spec->model;

    if (emb.provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, model);
    }

    if (emb.provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, model);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << emb.provider << "\n";
    return nullptr;
}

} // namespace sift
