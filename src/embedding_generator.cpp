#include "embedding_generator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "store/embedding_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace sift {

const std::vector<ProviderSpec>& provider_catalog() {
    static const std::vector<ProviderSpec> catalog = {
        {"openai-small", "openai", "text-embedding-3-small", 1536, 8191},
        {"openai-large", "openai", "text-embedding-3-large", 3072, 8191},
        {"openai-ada",   "openai", "text-embedding-ada-002", 1536, 8191},
        {"ollama-nomic", "ollama", "nomic-embed-text",        768, 2048},
    };
    return catalog;
}

std::optional<ProviderSpec> find_provider_spec(const std::string& id) {
    for (const auto& spec : provider_catalog()) {
        if (spec.id == id) return spec;
    }
    return std::nullopt;
}

ProviderSpec provider_spec_for(const EmbeddingsConfig& config) {
    if (auto spec = find_provider_spec(config.model)) return *spec;

    ProviderSpec spec;
    spec.id = config.model;
    spec.provider = config.provider;
    spec.model = config.model;
    return spec;
}

std::string truncate_for_tokens(const std::string& text, uint32_t max_tokens) {
    size_t max_chars = static_cast<size_t>(max_tokens) * kCharsPerToken;
    if (max_tokens == 0 || utf16_length(text) <= max_chars) return text;
    return utf8_prefix(text, max_chars) + "...";
}

EmbeddingGenerator::EmbeddingGenerator(Embedder& embedder, ProviderSpec spec)
    : embedder_(embedder), spec_(std::move(spec)) {}

EmbeddingResult EmbeddingGenerator::generate(const std::string& text) const {
    return generate(text, spec_);
}

EmbeddingResult EmbeddingGenerator::generate(const std::string& text,
                                             const ProviderSpec& spec) const {
    std::string input = truncate_for_tokens(text, spec.max_tokens);

    EmbeddingResponse response = embedder_.embed(input, spec.model);
    if (response.vector.empty()) {
        throw ProviderError(spec.provider, "empty embedding");
    }
    if (spec.dimensions != 0 && response.vector.size() != spec.dimensions) {
        throw ProviderError(spec.provider,
                            "expected " + std::to_string(spec.dimensions) +
                            " dimensions for " + spec.model + ", got " +
                            std::to_string(response.vector.size()));
    }

    EmbeddingResult result;
    result.dimensions = static_cast<uint32_t>(response.vector.size());
    result.vector = std::move(response.vector);
    result.token_count = response.token_count;
    result.provider = spec.provider;
    result.model = spec.model;
    return result;
}

EmbeddingResult embed_item(const EmbeddingGenerator& generator, EmbeddingStore& store,
                           const std::string& item_id, const std::string& content) {
    EmbeddingResult result = generator.generate(content);
    store.upsert(item_id, result.vector, {result.provider, result.model, result.token_count});
    return result;
}

uint32_t embed_items(const EmbeddingGenerator& generator, EmbeddingStore& store,
                     const std::vector<ItemText>& items, uint32_t wave_size) {
    if (wave_size == 0) wave_size = 1;

    std::vector<char> ok(items.size(), 0);
    for (size_t start = 0; start < items.size(); start += wave_size) {
        size_t end = std::min(items.size(), start + wave_size);

        std::vector<std::thread> wave;
        wave.reserve(end - start);
        for (size_t i = start; i < end; i++) {
            wave.emplace_back([&, i]() {
                try {
                    embed_item(generator, store, items[i].id, items[i].content);
                    ok[i] = 1;
                } catch (const std::exception& e) {
                    std::cerr << "[embedder] Failed to embed item " << items[i].id
                              << ": " << e.what() << "\n";
                }
            });
        }
        for (auto& t : wave) t.join();
    }

    uint32_t embedded = 0;
    for (char c : ok) embedded += c ? 1 : 0;
    return embedded;
}

} // namespace sift
