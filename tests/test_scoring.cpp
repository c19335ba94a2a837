#include <catch2/catch_test_macros.hpp>
#include "scoring.hpp"
#include <cmath>
#include <limits>

using namespace agentmem;

static constexpr uint64_t kDay = 86400;
static constexpr uint64_t kNow = 1700000000;

static MemoryRecord make_record(const std::string& key, std::optional<Embedding> emb,
                                uint64_t updated_at) {
    MemoryRecord r;
    r.key = key;
    r.value = "value of " + key;
    r.category = MemoryCategory::General;
    r.embedding = std::move(emb);
    r.updated_at = updated_at;
    return r;
}

// ── Recency ──────────────────────────────────────────────────

TEST_CASE("recency_score: 1.0 at age 0", "[scoring]") {
    REQUIRE(recency_score(0, 30.0) == 1.0);
}

TEST_CASE("recency_score: 0.5 at one half-life, 0.25 at two", "[scoring]") {
    REQUIRE(std::abs(recency_score(30 * kDay, 30.0) - 0.5) < 1e-9);
    REQUIRE(std::abs(recency_score(60 * kDay, 30.0) - 0.25) < 1e-9);
}

TEST_CASE("recency_score: decreases monotonically", "[scoring]") {
    double d1 = recency_score(1 * kDay, 30.0);
    double d2 = recency_score(10 * kDay, 30.0);
    double d3 = recency_score(100 * kDay, 30.0);
    REQUIRE(d1 > d2);
    REQUIRE(d2 > d3);
    REQUIRE(d3 > 0.0);
}

TEST_CASE("recency_score: non-positive half-life disables decay", "[scoring]") {
    REQUIRE(recency_score(365 * kDay, 0.0) == 1.0);
    REQUIRE(recency_score(365 * kDay, -1.0) == 1.0);
}

// ── Semantic ─────────────────────────────────────────────────

TEST_CASE("semantic_score: no embedding uses default without anomaly", "[scoring]") {
    auto s = semantic_score({1.0f, 0.0f}, std::nullopt, 0.5);
    REQUIRE(s.score == 0.5);
    REQUIRE_FALSE(s.anomaly);
}

TEST_CASE("semantic_score: negative similarity clamps to 0", "[scoring]") {
    auto s = semantic_score({1.0f, 0.0f}, Embedding{-1.0f, 0.0f}, 0.5);
    REQUIRE(s.score == 0.0);
    REQUIRE_FALSE(s.anomaly);
}

TEST_CASE("semantic_score: unusable embeddings are anomalies", "[scoring]") {
    Embedding query = {1.0f, 0.0f};

    auto wrong_dims = semantic_score(query, Embedding{1.0f, 0.0f, 0.0f}, 0.5);
    REQUIRE(wrong_dims.anomaly);
    REQUIRE(wrong_dims.score == 0.5);

    auto empty = semantic_score(query, Embedding{}, 0.5);
    REQUIRE(empty.anomaly);
    REQUIRE(empty.score == 0.5);

    auto zero = semantic_score(query, Embedding{0.0f, 0.0f}, 0.5);
    REQUIRE(zero.anomaly);

    float nan = std::numeric_limits<float>::quiet_NaN();
    auto non_finite = semantic_score(query, Embedding{nan, 1.0f}, 0.5);
    REQUIRE(non_finite.anomaly);
    REQUIRE(non_finite.score == 0.5);
}

// ── Composite ────────────────────────────────────────────────

TEST_CASE("CompositeScorer: 30-day-old record at similarity 0.5 scores 0.5", "[scoring]") {
    RetrievalConfig cfg;
    CompositeScorer scorer(cfg);

    Embedding query = {1.0f, 0.0f};
    auto r = make_record("trip", Embedding{0.5f, 0.8660254f}, kNow - 30 * kDay);

    auto parts = scorer.score(r, query, kNow);
    REQUIRE(std::abs(parts.semantic - 0.5) < 1e-4);
    REQUIRE(std::abs(parts.recency - 0.5) < 1e-9);
    REQUIRE(parts.importance == 0.5);
    REQUIRE(std::abs(parts.composite - 0.5) < 1e-4);
    REQUIRE(parts.composite >= cfg.min_score);
}

TEST_CASE("CompositeScorer: orthogonal 30-day-old record falls below threshold", "[scoring]") {
    RetrievalConfig cfg;
    CompositeScorer scorer(cfg);

    auto r = make_record("noise", Embedding{0.0f, 1.0f}, kNow - 30 * kDay);
    auto parts = scorer.score(r, {1.0f, 0.0f}, kNow);
    REQUIRE(std::abs(parts.composite - 0.2) < 1e-6);
    REQUIRE(parts.composite < cfg.min_score);
}

TEST_CASE("CompositeScorer: future timestamp counts as brand new", "[scoring]") {
    RetrievalConfig cfg;
    CompositeScorer scorer(cfg);

    auto r = make_record("skewed", std::nullopt, kNow + 3600);
    REQUIRE(scorer.score(r, {1.0f}, kNow).recency == 1.0);
}

TEST_CASE("CompositeScorer: weights and defaults come from config", "[scoring]") {
    RetrievalConfig cfg;
    cfg.semantic_weight = 0.0;
    cfg.recency_weight = 0.0;
    cfg.importance_weight = 1.0;
    cfg.default_importance = 0.9;
    CompositeScorer scorer(cfg);

    auto r = make_record("k", std::nullopt, kNow);
    REQUIRE(std::abs(scorer.score(r, {1.0f}, kNow).composite - 0.9) < 1e-9);
}

TEST_CASE("CompositeScorer: importance function overrides the default", "[scoring]") {
    RetrievalConfig cfg;
    CompositeScorer scorer(cfg, [](const MemoryRecord& r) {
        return r.key == "vip" ? 1.0 : 0.0;
    });

    auto vip = make_record("vip", std::nullopt, kNow);
    auto other = make_record("other", std::nullopt, kNow);
    REQUIRE(scorer.score(vip, {1.0f}, kNow).importance == 1.0);
    REQUIRE(scorer.score(other, {1.0f}, kNow).importance == 0.0);
}

TEST_CASE("CompositeScorer: score_memory carries record fields", "[scoring]") {
    RetrievalConfig cfg;
    CompositeScorer scorer(cfg);

    auto r = make_record("k", Embedding{1.0f, 0.0f}, kNow);
    auto s = scorer.score_memory(r, {1.0f, 0.0f}, kNow);
    REQUIRE(s.key == "k");
    REQUIRE(s.value == "value of k");
    REQUIRE(s.category == MemoryCategory::General);
    REQUIRE(s.score == s.parts.composite);
    REQUIRE(std::abs(s.score - 0.95) < 1e-6);
}
