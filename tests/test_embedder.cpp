#include <catch2/catch.hpp>
#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedding_generator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "store/embedding_store.hpp"
#include "util.hpp"
#include "mock_embedder.hpp"
#include "mock_http_client.hpp"
#include "mock_store.hpp"
#include <nlohmann/json.hpp>

using namespace sift;

static HttpResponse openai_response(const Embedding& v, uint32_t tokens = 7) {
    nlohmann::json item = {{"embedding", v}, {"index", 0}};
    nlohmann::json j;
    j["data"] = nlohmann::json::array({item});
    j["usage"] = {{"prompt_tokens", tokens}, {"total_tokens", tokens}};
    return {200, j.dump(), ""};
}

// ── HttpEmbedder: OpenAI ─────────────────────────────────────

TEST_CASE("OpenAI embedder: sends model, input and bearer token", "[embedder]") {
    MockHttpClient http;
    http.next_response = openai_response({0.1f, 0.2f, 0.3f});

    auto embedder = create_openai_embedder("sk-test", http, "", "");
    auto result = embedder->embed("hello world", "text-embedding-3-large");

    REQUIRE(http.last_url == "https://api.openai.com/v1/embeddings");
    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["model"] == "text-embedding-3-large");
    REQUIRE(body["input"] == "hello world");

    bool has_auth = false;
    for (const auto& h : http.last_headers) {
        if (h.first == "Authorization" && h.second == "Bearer sk-test") has_auth = true;
    }
    REQUIRE(has_auth);

    REQUIRE(result.vector.size() == 3);
    REQUIRE(result.vector[1] == 0.2f);
    REQUIRE(result.token_count == 7);
    REQUIRE(embedder->embedder_name() == "openai");
}

TEST_CASE("OpenAI embedder: empty model falls back to the configured one", "[embedder]") {
    MockHttpClient http;
    http.next_response = openai_response({1.0f});

    auto embedder = create_openai_embedder("sk", http, "http://proxy/v1", "my-model");
    embedder->embed("x", "");

    REQUIRE(http.last_url == "http://proxy/v1/embeddings");
    REQUIRE(nlohmann::json::parse(http.last_body)["model"] == "my-model");
}

TEST_CASE("OpenAI embedder: non-2xx raises ProviderError with status", "[embedder]") {
    MockHttpClient http;
    http.next_response = {429, R"({"error":"rate limited"})", ""};

    auto embedder = create_openai_embedder("sk", http, "", "");
    try {
        embedder->embed("x", "");
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.provider() == "openai");
        REQUIRE(e.status().has_value());
        REQUIRE(e.status().value_or(0) == 429);
        REQUIRE(std::string(e.what()).find("rate limited") != std::string::npos);
    }
}

TEST_CASE("OpenAI embedder: transport failure raises ProviderError", "[embedder]") {
    MockHttpClient http;
    http.next_response = {0, "", "Couldn't connect to server"};

    auto embedder = create_openai_embedder("sk", http, "", "");
    try {
        embedder->embed("x", "");
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE_FALSE(e.status().has_value());
        REQUIRE(std::string(e.what()).find("Couldn't connect") != std::string::npos);
    }
}

TEST_CASE("OpenAI embedder: client exception becomes ProviderError", "[embedder]") {
    MockHttpClient http;
    http.throw_on_post = true;

    auto embedder = create_openai_embedder("sk", http, "", "");
    REQUIRE_THROWS_AS(embedder->embed("x", ""), ProviderError);
}

TEST_CASE("OpenAI embedder: malformed body raises ProviderError", "[embedder]") {
    MockHttpClient http;
    auto embedder = create_openai_embedder("sk", http, "", "");

    http.next_response = {200, "not json", ""};
    REQUIRE_THROWS_AS(embedder->embed("x", ""), ProviderError);

    http.next_response = {200, R"({"data":[]})", ""};
    REQUIRE_THROWS_AS(embedder->embed("x", ""), ProviderError);

    http.next_response = {200, R"({"data":[{"embedding":[]}]})", ""};
    REQUIRE_THROWS_AS(embedder->embed("x", ""), ProviderError);
}

// ── HttpEmbedder: Ollama ─────────────────────────────────────

TEST_CASE("Ollama embedder: parses embeddings array", "[embedder]") {
    MockHttpClient http;
    http.next_response = {200, R"({"model":"nomic-embed-text","embeddings":[[0.5,0.25]],"prompt_eval_count":3})", ""};

    auto embedder = create_ollama_embedder(http, "", "");
    auto result = embedder->embed("text", "");

    REQUIRE(http.last_url == "http://localhost:11434/api/embed");
    REQUIRE(nlohmann::json::parse(http.last_body)["model"] == "nomic-embed-text");
    for (const auto& h : http.last_headers) REQUIRE(h.first != "Authorization");
    REQUIRE(result.vector == Embedding{0.5f, 0.25f});
    REQUIRE(result.token_count == 3);
    REQUIRE(embedder->embedder_name() == "ollama");
}

// ── create_embedder ──────────────────────────────────────────

TEST_CASE("create_embedder: provider selection", "[embedder]") {
    MockHttpClient http;
    Config cfg;

    cfg.embeddings.provider = "none";
    REQUIRE(create_embedder(cfg, http) == nullptr);

    cfg.embeddings.provider = "openai";
    cfg.embeddings.api_key = "";
    REQUIRE(create_embedder(cfg, http) == nullptr);

    cfg.embeddings.api_key = "sk";
    auto openai = create_embedder(cfg, http);
    REQUIRE(openai != nullptr);
    REQUIRE(openai->embedder_name() == "openai");

    cfg.embeddings.provider = "ollama";
    auto ollama = create_embedder(cfg, http);
    REQUIRE(ollama != nullptr);
    REQUIRE(ollama->embedder_name() == "ollama");

    cfg.embeddings.provider = "cohere";
    REQUIRE(create_embedder(cfg, http) == nullptr);
}

TEST_CASE("create_embedder: catalog key maps to provider model", "[embedder]") {
    MockHttpClient http;
    http.next_response = openai_response({1.0f});
    Config cfg;
    cfg.embeddings.provider = "openai";
    cfg.embeddings.api_key = "sk";
    cfg.embeddings.model = "openai-ada";

    auto embedder = create_embedder(cfg, http);
    REQUIRE(embedder != nullptr);
    embedder->embed("x", "");
    REQUIRE(nlohmann::json::parse(http.last_body)["model"] == "text-embedding-ada-002");
}

// ── Provider catalog ─────────────────────────────────────────

TEST_CASE("provider catalog: dimensions and token limits", "[embedder]") {
    auto small = find_provider_spec("openai-small");
    REQUIRE(small.has_value());
    REQUIRE(small->model == "text-embedding-3-small");
    REQUIRE(small->dimensions == 1536);
    REQUIRE(small->max_tokens == 8191);

    REQUIRE(find_provider_spec("openai-large")->dimensions == 3072);
    REQUIRE(find_provider_spec("openai-ada")->dimensions == 1536);
    REQUIRE(find_provider_spec("ollama-nomic")->dimensions == 768);
    REQUIRE_FALSE(find_provider_spec("unknown").has_value());
}

TEST_CASE("provider_spec_for: raw model names are not dimension checked", "[embedder]") {
    EmbeddingsConfig cfg;
    cfg.provider = "ollama";
    cfg.model = "mxbai-embed-large";

    auto spec = provider_spec_for(cfg);
    REQUIRE(spec.provider == "ollama");
    REQUIRE(spec.model == "mxbai-embed-large");
    REQUIRE(spec.dimensions == 0);
    REQUIRE(spec.max_tokens == 0);

    cfg.model = "openai-large";
    REQUIRE(provider_spec_for(cfg).dimensions == 3072);
}

// ── EmbeddingGenerator ───────────────────────────────────────

static ProviderSpec test_spec(uint32_t dims = 4, uint32_t max_tokens = 8191) {
    return {"test", "mock", "mock-model", dims, max_tokens};
}

TEST_CASE("truncate_for_tokens: cuts at four chars per token", "[embedder]") {
    REQUIRE(truncate_for_tokens("abcdefgh", 2) == "abcdefgh");
    REQUIRE(truncate_for_tokens("abcdefghij", 2) == "abcdefgh...");
    REQUIRE(truncate_for_tokens("anything", 0) == "anything");
}

TEST_CASE("truncate_for_tokens: never splits a multibyte character", "[embedder]") {
    // 7 ASCII characters + "\xC3\xA9" fill the 8-character budget exactly
    REQUIRE(truncate_for_tokens("abcdefg\xC3\xA9 more words", 2) == "abcdefg\xC3\xA9...");

    std::string accents;
    for (int i = 0; i < 10; i++) accents += "\xC3\xA9";
    std::string cut = truncate_for_tokens(accents, 2);
    REQUIRE(cut.size() == 8 * 2 + 3);
    REQUIRE(utf16_length(cut) == 8 + 3);

    // An astral code point counts as two characters and is dropped whole
    REQUIRE(truncate_for_tokens("abcdefg\xF0\x9F\x98\x80xyz", 2) == "abcdefg...");
}

TEST_CASE("truncate_for_tokens: counts characters, not bytes", "[embedder]") {
    // Eight CJK characters are 24 bytes but fit two tokens' worth of characters
    std::string cjk;
    for (int i = 0; i < 8; i++) cjk += "\xE8\xAA\x9E";
    REQUIRE(truncate_for_tokens(cjk, 2) == cjk);
    REQUIRE(truncate_for_tokens(cjk + "\xE8\xAA\x9E", 2) == cjk + "...");
}

TEST_CASE("EmbeddingGenerator: truncated non-ASCII input is valid JSON for the provider", "[embedder]") {
    MockHttpClient http;
    http.next_response = openai_response({0.1f, 0.2f, 0.3f});
    auto embedder = create_openai_embedder("sk-test", http, "", "");
    EmbeddingGenerator gen(*embedder, {"test", "openai", "text-embedding-3-small", 3, 2});

    EmbeddingResult result;
    REQUIRE_NOTHROW(result = gen.generate("abcdefg\xC3\xA9 more words"));
    REQUIRE(result.vector.size() == 3);

    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["input"] == "abcdefg\xC3\xA9...");
}

TEST_CASE("EmbeddingGenerator: returns provider metadata", "[embedder]") {
    KeywordMockEmbedder embedder;
    EmbeddingGenerator gen(embedder, test_spec());

    auto result = gen.generate("a cat on the mat");
    REQUIRE(result.vector.size() == 4);
    REQUIRE(result.dimensions == 4);
    REQUIRE(result.provider == "mock");
    REQUIRE(result.model == "mock-model");
    REQUIRE(embedder.last_model == "mock-model");
    REQUIRE(gen.spec().id == "test");
}

TEST_CASE("EmbeddingGenerator: truncates long input before embedding", "[embedder]") {
    KeywordMockEmbedder embedder;
    EmbeddingGenerator gen(embedder, test_spec(4, 8191));

    std::string text(40000, 'a');
    gen.generate(text);

    std::string sent = embedder.last_text_seen();
    REQUIRE(sent.size() == 8191 * 4 + 3);
    REQUIRE(sent.substr(sent.size() - 3) == "...");
}

TEST_CASE("EmbeddingGenerator: dimension differing from catalog is a ProviderError", "[embedder]") {
    KeywordMockEmbedder embedder;
    embedder.dimensions = 8;
    EmbeddingGenerator gen(embedder, test_spec(4));
    REQUIRE_THROWS_AS(gen.generate("text"), ProviderError);
}

TEST_CASE("EmbeddingGenerator: empty vector is a ProviderError", "[embedder]") {
    FixedMockEmbedder embedder(Embedding{});
    EmbeddingGenerator gen(embedder, test_spec(0));
    REQUIRE_THROWS_AS(gen.generate("text"), ProviderError);
}

TEST_CASE("EmbeddingGenerator: provider failure propagates without retry", "[embedder]") {
    KeywordMockEmbedder embedder;
    embedder.fail = true;
    EmbeddingGenerator gen(embedder, test_spec());
    REQUIRE_THROWS_AS(gen.generate("text"), ProviderError);
    REQUIRE(embedder.embed_count == 1);
}

// ── embed_item / embed_items ─────────────────────────────────

TEST_CASE("embed_item: generates and stores the vector", "[embedder]") {
    KeywordMockEmbedder embedder;
    EmbeddingGenerator gen(embedder, test_spec());
    MockContentStore content;
    content.add("owner", "i1", "python code");
    EmbeddingStore store(content);

    auto result = embed_item(gen, store, "i1", "python code");
    auto stored = content.get_embedding("i1");
    REQUIRE(stored.has_value());
    REQUIRE(stored->vector == result.vector);
    REQUIRE(stored->provider == "mock");
    REQUIRE(stored->model == "mock-model");
    REQUIRE(stored->dimensions == 4);
}

TEST_CASE("embed_items: embeds every item across waves", "[embedder]") {
    KeywordMockEmbedder embedder;
    EmbeddingGenerator gen(embedder, test_spec());
    MockContentStore content;
    EmbeddingStore store(content);

    std::vector<ItemText> items;
    for (int i = 0; i < 7; i++) {
        std::string id = "item" + std::to_string(i);
        content.add("owner", id, "recipe " + id);
        items.push_back({id, "recipe " + id});
    }

    REQUIRE(embed_items(gen, store, items, 3) == 7);
    REQUIRE(embedder.embed_count == 7);
    for (const auto& item : items) REQUIRE(content.get_embedding(item.id).has_value());
}

TEST_CASE("embed_items: failures are skipped and not counted", "[embedder]") {
    KeywordMockEmbedder embedder;
    embedder.fail = true;
    EmbeddingGenerator gen(embedder, test_spec());
    MockContentStore content;
    EmbeddingStore store(content);

    std::vector<ItemText> items = {{"a", "x"}, {"b", "y"}};
    REQUIRE(embed_items(gen, store, items, 0) == 0);
    REQUIRE(embedder.embed_count == 2);
    REQUIRE_FALSE(content.get_embedding("a").has_value());
}
