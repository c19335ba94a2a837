#include "retrieval.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_set>

namespace agentmem {

std::string path_to_string(RetrievalPath path) {
    switch (path) {
        case RetrievalPath::Bulk:     return "bulk";
        case RetrievalPath::CoreOnly: return "core_only";
        case RetrievalPath::Hybrid:   return "hybrid";
        case RetrievalPath::Degraded: return "degraded";
    }
    return "bulk";
}

static RetrievedMemory to_retrieved(const MemoryRecord& r) {
    return {r.key, r.value, r.category};
}

// Core first (original order), then ranked contextual; first occurrence of a
// key wins.
static std::vector<RetrievedMemory> merge_unique(const std::vector<MemoryRecord>& core,
                                                 const std::vector<ScoredMemory>& contextual) {
    std::unordered_set<std::string> seen;
    seen.reserve(core.size() + contextual.size());

    std::vector<RetrievedMemory> result;
    result.reserve(core.size() + contextual.size());
    for (const auto& m : core) {
        if (seen.insert(m.key).second) result.push_back(to_retrieved(m));
    }
    for (const auto& m : contextual) {
        if (seen.insert(m.key).second) result.push_back({m.key, m.value, m.category});
    }
    return result;
}

RetrievalEngine::RetrievalEngine(MemoryStore& store, Embedder* embedder,
                                 RetrievalConfig config, ImportanceFn importance,
                                 Clock clock)
    : store_(store)
    , embedder_(embedder)
    , config_(std::move(config))
    , scorer_(config_, std::move(importance))
    , clock_(clock ? std::move(clock) : Clock(epoch_seconds))
{}

std::vector<RetrievedMemory> RetrievalEngine::retrieve(const std::string& agent_id,
                                                       const std::string& user_message,
                                                       const CallContext& ctx) const {
    return retrieve_detailed(agent_id, user_message, ctx).memories;
}

Embedding RetrievalEngine::embed_query(const std::string& user_message,
                                       const CallContext& ctx) const {
    if (!embedder_) {
        throw DependencyUnavailable("no embedding provider configured");
    }

    Embedding query = embedder_->embed(user_message, ctx);
    bool finite = std::all_of(query.begin(), query.end(),
                              [](float v) { return std::isfinite(v); });
    if (query.empty() || !finite) {
        throw DependencyUnavailable(embedder_->embedder_name() +
                                    " embedder returned an unusable query vector");
    }
    return query;
}

RetrievalResult RetrievalEngine::retrieve_detailed(const std::string& agent_id,
                                                   const std::string& user_message,
                                                   const CallContext& ctx) const {
    if (trim(agent_id).empty()) {
        throw ValidationError("agent_id must not be empty");
    }

    // One cut-off for every store query in this call
    const uint64_t now = clock_();

    RetrievalResult result;
    result.active_count = store_.count_active(agent_id, now, ctx);

    if (result.active_count <= config_.bulk_threshold) {
        auto all = store_.list_active(agent_id, std::nullopt, now, ctx);
        result.path = RetrievalPath::Bulk;
        result.memories.reserve(all.size());
        for (const auto& r : all) result.memories.push_back(to_retrieved(r));
        return result;
    }

    auto core = store_.list_active(agent_id, MemoryGroup::Core, now, ctx);
    auto contextual = store_.list_active(agent_id, MemoryGroup::Contextual, now, ctx);
    result.core_count = core.size();
    result.contextual_candidates = contextual.size();

    if (contextual.empty()) {
        result.path = RetrievalPath::CoreOnly;
        result.memories = merge_unique(core, {});
        return result;
    }

    Embedding query;
    try {
        query = embed_query(user_message, ctx);
    } catch (const DependencyUnavailable& e) {
        // A cancelled call stops here whatever the policy
        if (config_.on_embedding_failure != EmbeddingFailurePolicy::CoreOnly ||
            ctx.cancelled()) {
            throw;
        }
        std::cerr << "[retrieval] Query embedding unavailable for agent '" << agent_id
                  << "' (" << e.what() << "), using core memories only\n";
        result.path = RetrievalPath::Degraded;
        result.memories = merge_unique(core, {});
        return result;
    }

    std::vector<ScoredMemory> scored;
    scored.reserve(contextual.size());
    for (const auto& record : contextual) {
        auto s = scorer_.score_memory(record, query, now);
        if (s.parts.anomaly) result.anomalies++;
        if (s.score >= config_.min_score) scored.push_back(std::move(s));
    }

    if (result.anomalies > 0) {
        std::cerr << "[retrieval] " << result.anomalies << " of " << contextual.size()
                  << " contextual memories for agent '" << agent_id
                  << "' have unusable embeddings (expected " << query.size()
                  << " dimensions); scored with the default semantic score\n";
    }

    // Stable: equal scores keep store order so output is reproducible
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredMemory& a, const ScoredMemory& b) {
                         return a.score > b.score;
                     });
    if (scored.size() > config_.max_contextual_results) {
        scored.resize(config_.max_contextual_results);
    }

    result.path = RetrievalPath::Hybrid;
    result.memories = merge_unique(core, scored);
    result.ranked = std::move(scored);
    return result;
}

} // namespace agentmem
