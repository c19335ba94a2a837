#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace agentmem {

// What retrieval does when the query embedding cannot be obtained.
enum class EmbeddingFailurePolicy {
    Fail,     // propagate DependencyUnavailable
    CoreOnly  // log and return the core memories alone
};

std::string policy_to_string(EmbeddingFailurePolicy policy);
std::optional<EmbeddingFailurePolicy> policy_from_string(const std::string& s);

// Tuning knobs for RetrievalEngine. The engine keeps its own const copy.
// semantic_weight + recency_weight + importance_weight should sum to 1.0 so
// composite scores stay in [0,1]; this is a convention and is not checked.
struct RetrievalConfig {
    uint32_t bulk_threshold = 30;        // active count <= this: return everything
    uint32_t max_contextual_results = 10;
    double min_score = 0.3;              // composite below this is dropped
    double semantic_weight = 0.6;
    double recency_weight = 0.3;
    double importance_weight = 0.1;
    double recency_half_life_days = 30.0;
    double default_semantic_score = 0.5; // record has no usable embedding
    double default_importance = 0.5;
    EmbeddingFailurePolicy on_embedding_failure = EmbeddingFailurePolicy::Fail;
};

struct StoreConfig {
#ifdef AGENTMEM_HAS_SQLITE_STORE
    std::string backend = "sqlite";
#else
    std::string backend = "json";
#endif
    std::string path; // empty = ~/.agentmem/memory.{db,json}
};

struct EmbeddingConfig {
    std::string provider; // "openai", "ollama"; empty = auto-detect
    std::string api_key;
    std::string base_url;
    std::string model;
    uint32_t timeout_ms = 30000;
};

struct Config {
    StoreConfig store;
    EmbeddingConfig embeddings;
    RetrievalConfig retrieval;

    // Load from ~/.agentmem/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document. Fields with the wrong type keep their default.
    static Config from_json(const nlohmann::json& j);
};

} // namespace agentmem
