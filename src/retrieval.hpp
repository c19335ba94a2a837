#pragma once
#include "memory.hpp"
#include "embedder.hpp"
#include "config.hpp"
#include "scoring.hpp"
#include "call_context.hpp"
#include <functional>
#include <string>
#include <vector>

namespace agentmem {

enum class RetrievalPath {
    Bulk,     // active count <= bulk_threshold: everything, store order
    CoreOnly, // above threshold but no contextual memories
    Hybrid,   // core + ranked contextual
    Degraded  // query embedding unavailable, core only by policy
};

std::string path_to_string(RetrievalPath path);

// Memories plus what happened on the way, for tests and --explain.
struct RetrievalResult {
    std::vector<RetrievedMemory> memories;
    RetrievalPath path = RetrievalPath::Bulk;
    uint32_t active_count = 0;
    size_t core_count = 0;
    size_t contextual_candidates = 0;
    size_t anomalies = 0;
    std::vector<ScoredMemory> ranked; // contextual survivors, best first
};

// Decides which of an agent's memories go into the prompt.
//
// Up to bulk_threshold active memories are returned as-is without an
// embedding call. Above it, core memories are always kept and contextual
// ones are scored against the query embedding, filtered by min_score,
// ranked (stable: equal scores keep store order) and truncated to
// max_contextual_results. Output is core first, then contextual, unique by key.
//
// The engine never writes and holds no mutable state, so concurrent calls
// are safe as long as the store and embedder are.
class RetrievalEngine {
public:
    using Clock = std::function<uint64_t()>; // epoch seconds

    // `store` and `embedder` must outlive the engine. `embedder` may be null,
    // in which case the hybrid path behaves as if the embedding call failed.
    RetrievalEngine(MemoryStore& store, Embedder* embedder, RetrievalConfig config,
                    ImportanceFn importance = {}, Clock clock = {});

    // Throws ValidationError for an empty agent id and DependencyUnavailable
    // when the store or (under the "fail" policy) the embedder is unavailable.
    std::vector<RetrievedMemory> retrieve(const std::string& agent_id,
                                          const std::string& user_message,
                                          const CallContext& ctx = {}) const;

    RetrievalResult retrieve_detailed(const std::string& agent_id,
                                      const std::string& user_message,
                                      const CallContext& ctx = {}) const;

    const RetrievalConfig& config() const { return config_; }

private:
    Embedding embed_query(const std::string& user_message, const CallContext& ctx) const;

    MemoryStore& store_;
    Embedder* embedder_;
    const RetrievalConfig config_;
    CompositeScorer scorer_;
    Clock clock_;
};

} // namespace agentmem
