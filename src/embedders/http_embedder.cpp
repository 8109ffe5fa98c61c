#include "http_embedder.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

namespace sift {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
{}

EmbeddingResponse HttpEmbedder::embed(const std::string& text, const std::string& model) {
    nlohmann::json body = {
        {"model", model.empty() ? config_.model : model},
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
        response = http_.post(config_.base_url + config_.endpoint, body.dump(), headers,
                              config_.timeout_seconds);
    } catch (const std::exception& e) {
        throw ProviderError(config_.name, e.what());
    }

    if (response.status_code == 0) {
        throw ProviderError(config_.name, response.error.empty()
                                              ? "request failed"
                                              : "request failed: " + response.error);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ProviderError(config_.name, response.body, response.status_code);
    }

    EmbeddingResponse result;
    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        result.vector.reserve(arr.size());
        for (const auto& val : arr) {
            result.vector.push_back(val.get<float>());
        }
        if (!config_.tokens_path.empty()) {
            nlohmann::json::json_pointer tokens(config_.tokens_path);
            if (j.contains(tokens) && j.at(tokens).is_number_unsigned()) {
                result.token_count = j.at(tokens).get<uint32_t>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProviderError(config_.name, std::string("malformed response: ") + e.what(),
                            response.status_code);
    }

    if (result.vector.empty()) {
        throw ProviderError(config_.name, "empty embedding", response.status_code);
    }
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.tokens_path = "/usage/total_tokens";
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.tokens_path = "/prompt_eval_count";
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace sift
