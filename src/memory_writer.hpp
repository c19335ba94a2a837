#pragma once
#include "memory.hpp"
#include "embedder.hpp"
#include "call_context.hpp"
#include <functional>
#include <optional>
#include <string>

namespace agentmem {

// Write path for memories: stamps times, computes the embedding and upserts.
// The retrieval engine never writes; everything that creates records goes
// through here.
class MemoryWriter {
public:
    using Clock = std::function<uint64_t()>; // epoch seconds

    // `embedder` may be null; records are then stored without embeddings.
    MemoryWriter(MemoryStore& store, Embedder* embedder, Clock clock = {});

    // Upsert (agent_id, key). Embeds "key: value"; if that fails the record is
    // stored without an embedding and the failure is logged.
    // Throws ValidationError for an empty agent id or key.
    MemoryRecord remember(const std::string& agent_id,
                          const std::string& key,
                          const std::string& value,
                          MemoryCategory category,
                          std::optional<uint64_t> ttl_seconds = std::nullopt,
                          const CallContext& ctx = {});

    // Compute embeddings for the agent's active records that have none (or an
    // empty one).
    // updated_at is left alone so recency is unaffected. Returns the number
    // of records updated; throws DependencyUnavailable if the embedder fails.
    uint32_t reembed_missing(const std::string& agent_id, const CallContext& ctx = {});

    // Text embedded for a record
    static std::string embedding_text(const std::string& key, const std::string& value);

private:
    MemoryStore& store_;
    Embedder* embedder_;
    Clock clock_;
};

} // namespace agentmem
