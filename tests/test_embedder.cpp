#include <catch2/catch_test_macros.hpp>
#include "embedder.hpp"
#include "config.hpp"
#include "mock_http_client.hpp"
#include <cmath>

using namespace agentmem;

// ── Cosine similarity ────────────────────────────────────────

TEST_CASE("cosine_similarity: identical vectors", "[embedder]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, a) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: orthogonal vectors", "[embedder]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    Embedding b = {0.0f, 1.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b)) < 1e-6);
}

TEST_CASE("cosine_similarity: opposite vectors", "[embedder]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    Embedding b = {-1.0f, 0.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b) + 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: scale invariant", "[embedder]") {
    Embedding a = {1.0f, 2.0f, 3.0f};
    Embedding b = {2.0f, 4.0f, 6.0f};
    REQUIRE(std::abs(cosine_similarity(a, b) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: empty vectors return 0", "[embedder]") {
    Embedding a;
    REQUIRE(cosine_similarity(a, a) == 0.0);
}

TEST_CASE("cosine_similarity: mismatched lengths return 0", "[embedder]") {
    Embedding a = {1.0f, 2.0f};
    Embedding b = {1.0f, 2.0f, 3.0f};
    REQUIRE(cosine_similarity(a, b) == 0.0);
}

TEST_CASE("cosine_similarity: zero vector returns 0", "[embedder]") {
    Embedding a = {0.0f, 0.0f, 0.0f};
    Embedding b = {1.0f, 2.0f, 3.0f};
    REQUIRE(cosine_similarity(a, b) == 0.0);
}

TEST_CASE("cosine_similarity: 60 degree angle", "[embedder]") {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {0.5f, 0.866025f};
    REQUIRE(std::abs(cosine_similarity(a, b) - 0.5) < 1e-4);
}

// ── Factory ──────────────────────────────────────────────────

TEST_CASE("create_embedder: no provider and no key disables embeddings", "[embedder]") {
    MockHttpClient http;
    Config cfg;
    REQUIRE(create_embedder(cfg, http) == nullptr);
}

TEST_CASE("create_embedder: api key auto-detects openai", "[embedder]") {
    MockHttpClient http;
    Config cfg;
    cfg.embeddings.api_key = "sk-test";
    auto e = create_embedder(cfg, http);
    REQUIRE(e != nullptr);
    REQUIRE(e->embedder_name() == "openai");
    REQUIRE(e->dimensions() == 1536);
}

TEST_CASE("create_embedder: openai without key returns nullptr", "[embedder]") {
    MockHttpClient http;
    Config cfg;
    cfg.embeddings.provider = "openai";
    REQUIRE(create_embedder(cfg, http) == nullptr);
}

TEST_CASE("create_embedder: ollama needs no key", "[embedder]") {
    MockHttpClient http;
    Config cfg;
    cfg.embeddings.provider = "ollama";
    auto e = create_embedder(cfg, http);
    REQUIRE(e != nullptr);
    REQUIRE(e->embedder_name() == "ollama");
    REQUIRE(e->dimensions() == 768);
}

TEST_CASE("create_embedder: unknown provider returns nullptr", "[embedder]") {
    MockHttpClient http;
    Config cfg;
    cfg.embeddings.provider = "cohere";
    REQUIRE(create_embedder(cfg, http) == nullptr);
}
