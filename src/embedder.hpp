#pragma once
#include "similarity/vector.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace sift {

class HttpClient; // forward declare
struct Config;    // forward declare

struct EmbeddingResponse {
    Embedding vector;
    uint32_t token_count = 0;
};

// Abstract embedding provider interface
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute the embedding of `text` with `model` (empty = provider default).
    // Throws ProviderError on any downstream failure.
    virtual EmbeddingResponse embed(const std::string& text, const std::string& model) = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace sift
