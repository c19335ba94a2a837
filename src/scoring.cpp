#include "scoring.hpp"
#include <algorithm>
#include <cmath>

namespace agentmem {

static constexpr double kSecondsPerDay = 86400.0;

double recency_score(uint64_t age_seconds, double half_life_days) {
    if (half_life_days <= 0.0) return 1.0;
    double age_days = static_cast<double>(age_seconds) / kSecondsPerDay;
    return std::pow(0.5, age_days / half_life_days);
}

static bool usable_embedding(const Embedding& emb, size_t expected_dims) {
    if (emb.empty() || emb.size() != expected_dims) return false;

    double norm = 0.0;
    for (float v : emb) {
        if (!std::isfinite(v)) return false;
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    return norm > 0.0;
}

SemanticResult semantic_score(const Embedding& query,
                              const std::optional<Embedding>& record_embedding,
                              double default_score) {
    if (!record_embedding) return {default_score, false};
    if (!usable_embedding(*record_embedding, query.size())) return {default_score, true};

    double sim = cosine_similarity(query, *record_embedding);
    return {std::clamp(sim, 0.0, 1.0), false};
}

CompositeScorer::CompositeScorer(const RetrievalConfig& config, ImportanceFn importance)
    : config_(config)
    , importance_(std::move(importance))
{
    if (!importance_) {
        double fixed = config_.default_importance;
        importance_ = [fixed](const MemoryRecord&) { return fixed; };
    }
}

ScoreBreakdown CompositeScorer::score(const MemoryRecord& record, const Embedding& query,
                                      uint64_t now) const {
    ScoreBreakdown parts;

    auto semantic = semantic_score(query, record.embedding, config_.default_semantic_score);
    parts.semantic = semantic.score;
    parts.anomaly = semantic.anomaly;

    // Clock skew: a write stamped in the future counts as brand new
    uint64_t age = (now > record.updated_at) ? now - record.updated_at : 0;
    parts.recency = recency_score(age, config_.recency_half_life_days);

    parts.importance = importance_(record);

    parts.composite = config_.semantic_weight * parts.semantic
                    + config_.recency_weight * parts.recency
                    + config_.importance_weight * parts.importance;
    return parts;
}

ScoredMemory CompositeScorer::score_memory(const MemoryRecord& record, const Embedding& query,
                                           uint64_t now) const {
    ScoredMemory scored;
    scored.key = record.key;
    scored.value = record.value;
    scored.category = record.category;
    scored.parts = score(record, query, now);
    scored.score = scored.parts.composite;
    return scored;
}

} // namespace agentmem
