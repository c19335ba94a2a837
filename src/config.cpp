#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace agentmem {

std::string policy_to_string(EmbeddingFailurePolicy policy) {
    switch (policy) {
        case EmbeddingFailurePolicy::Fail:     return "fail";
        case EmbeddingFailurePolicy::CoreOnly: return "core_only";
    }
    return "fail";
}

std::optional<EmbeddingFailurePolicy> policy_from_string(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "fail")      return EmbeddingFailurePolicy::Fail;
    if (v == "core_only") return EmbeddingFailurePolicy::CoreOnly;
    return std::nullopt;
}

nlohmann::json Config::defaults_json() {
    RetrievalConfig r;
    return {
        {"store", {
#ifdef AGENTMEM_HAS_SQLITE_STORE
            {"backend", "sqlite"},
#else
            {"backend", "json"},
#endif
            {"path", ""}
        }},
        {"embeddings", {
            {"provider", ""},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""},
            {"timeout_ms", 30000}
        }},
        {"retrieval", {
            {"bulk_threshold", r.bulk_threshold},
            {"max_contextual_results", r.max_contextual_results},
            {"min_score", r.min_score},
            {"semantic_weight", r.semantic_weight},
            {"recency_weight", r.recency_weight},
            {"importance_weight", r.importance_weight},
            {"recency_half_life_days", r.recency_half_life_days},
            {"default_semantic_score", r.default_semantic_score},
            {"default_importance", r.default_importance},
            {"on_embedding_failure", policy_to_string(r.on_embedding_failure)}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string())
        out = obj[name].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_unsigned())
        out = obj[name].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* name, double& out) {
    if (obj.contains(name) && obj[name].is_number())
        out = obj[name].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "model", cfg.embeddings.model);
        read_uint(e, "timeout_ms", cfg.embeddings.timeout_ms);
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        auto& r = j["retrieval"];
        read_uint(r, "bulk_threshold", cfg.retrieval.bulk_threshold);
        read_uint(r, "max_contextual_results", cfg.retrieval.max_contextual_results);
        read_double(r, "min_score", cfg.retrieval.min_score);
        read_double(r, "semantic_weight", cfg.retrieval.semantic_weight);
        read_double(r, "recency_weight", cfg.retrieval.recency_weight);
        read_double(r, "importance_weight", cfg.retrieval.importance_weight);
        read_double(r, "recency_half_life_days", cfg.retrieval.recency_half_life_days);
        read_double(r, "default_semantic_score", cfg.retrieval.default_semantic_score);
        read_double(r, "default_importance", cfg.retrieval.default_importance);
        if (r.contains("on_embedding_failure") && r["on_embedding_failure"].is_string()) {
            auto policy = policy_from_string(r["on_embedding_failure"].get<std::string>());
            if (policy) {
                cfg.retrieval.on_embedding_failure = *policy;
            } else {
                std::cerr << "[config] Unknown on_embedding_failure value, using \"fail\"\n";
            }
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.agentmem/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("AGENTMEM_EMBEDDINGS_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.embeddings.api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }
    if (const char* v = std::getenv("AGENTMEM_STORE_BACKEND"))
        cfg.store.backend = v;
    if (const char* v = std::getenv("AGENTMEM_STORE_PATH"))
        cfg.store.path = v;

    return cfg;
}

} // namespace agentmem
