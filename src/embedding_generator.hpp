#pragma once
#include "embedder.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class EmbeddingStore; // forward declare

// Catalog entry for one (provider, model) pair. Dimensionality is fixed per pair.
struct ProviderSpec {
    std::string id;         // catalog key, e.g. "openai-small"
    std::string provider;   // e.g. "openai"
    std::string model;      // e.g. "text-embedding-3-small"
    uint32_t dimensions = 0;
    uint32_t max_tokens = 0;
};

const std::vector<ProviderSpec>& provider_catalog();
std::optional<ProviderSpec> find_provider_spec(const std::string& id);

struct EmbeddingsConfig; // forward declare

// Catalog entry named by config.model, or an ad-hoc spec for a raw model
// name (dimensions 0 = not checked, max_tokens 0 = no truncation).
ProviderSpec provider_spec_for(const EmbeddingsConfig& config);

// Approximate characters per token used for input truncation
constexpr size_t kCharsPerToken = 4;

struct EmbeddingResult {
    Embedding vector;
    uint32_t token_count = 0;
    uint32_t dimensions = 0;
    std::string provider;
    std::string model;
};

// Cut text to max_tokens * kCharsPerToken characters (UTF-16 code units),
// appending "..." when cut. The cut never splits a UTF-8 sequence.
std::string truncate_for_tokens(const std::string& text, uint32_t max_tokens);

// Generates embeddings through an Embedder. Stateless apart from the
// references it holds; no retries.
class EmbeddingGenerator {
public:
    EmbeddingGenerator(Embedder& embedder, ProviderSpec spec);

    // Throws ProviderError on any failure, including a vector whose length
    // differs from the catalog dimensions.
    EmbeddingResult generate(const std::string& text) const;
    EmbeddingResult generate(const std::string& text, const ProviderSpec& spec) const;

    const ProviderSpec& spec() const { return spec_; }

private:
    Embedder& embedder_;
    ProviderSpec spec_;
};

struct ItemText {
    std::string id;
    std::string content;
};

// Generate and upsert the embedding of one item.
EmbeddingResult embed_item(const EmbeddingGenerator& generator, EmbeddingStore& store,
                           const std::string& item_id, const std::string& content);

// Embed many items in waves of at most wave_size concurrent requests,
// waiting for each wave before starting the next. Failures are logged and
// skipped. Returns the number of items embedded.
uint32_t embed_items(const EmbeddingGenerator& generator, EmbeddingStore& store,
                     const std::vector<ItemText>& items, uint32_t wave_size);

} // namespace sift
