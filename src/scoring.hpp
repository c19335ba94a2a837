#pragma once
#include "memory.hpp"
#include "config.hpp"
#include <functional>
#include <optional>
#include <string>

namespace agentmem {

// Per-record importance signal. Defaults to RetrievalConfig::default_importance.
using ImportanceFn = std::function<double(const MemoryRecord&)>;

// Exponential decay 0.5^(age_days / half_life_days).
// 1.0 at age 0, 0.5 at one half-life. A non-positive half-life disables decay.
double recency_score(uint64_t age_seconds, double half_life_days);

struct SemanticResult {
    double score = 0.0;
    bool anomaly = false; // record had an embedding that could not be used
};

// Cosine similarity of the record against the query, clamped to [0,1].
// No embedding -> default_score. An embedding of the wrong dimension, zero
// length, zero magnitude or with non-finite components -> default_score
// with anomaly set.
SemanticResult semantic_score(const Embedding& query,
                              const std::optional<Embedding>& record_embedding,
                              double default_score);

struct ScoreBreakdown {
    double semantic = 0.0;
    double recency = 0.0;
    double importance = 0.0;
    double composite = 0.0;
    bool anomaly = false;
};

struct ScoredMemory {
    std::string key;
    std::string value;
    MemoryCategory category = MemoryCategory::General;
    double score = 0.0;
    ScoreBreakdown parts;
};

// composite = semantic_weight*semantic + recency_weight*recency + importance_weight*importance
class CompositeScorer {
public:
    explicit CompositeScorer(const RetrievalConfig& config, ImportanceFn importance = {});

    ScoreBreakdown score(const MemoryRecord& record, const Embedding& query,
                         uint64_t now) const;

    ScoredMemory score_memory(const MemoryRecord& record, const Embedding& query,
                              uint64_t now) const;

private:
    const RetrievalConfig config_;
    ImportanceFn importance_;
};

} // namespace agentmem
