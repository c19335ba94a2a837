#pragma once
#include "call_context.hpp"
#include "embedder.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace agentmem {

enum class MemoryCategory {
    Instruction,
    Preference,
    StyleCorrection,
    General,
    Context,
    History
};

// Core memories are always injected; contextual ones are relevance-filtered.
enum class MemoryGroup { Core, Contextual };

MemoryGroup group_of(MemoryCategory category);

// One durable fact about an agent. Key is unique within the agent's set.
struct MemoryRecord {
    std::string key;
    std::string value;
    MemoryCategory category = MemoryCategory::General;
    std::optional<Embedding> embedding; // nullopt = not computed yet
    uint64_t updated_at = 0;            // epoch seconds of the last write
    std::optional<uint64_t> expires_at; // epoch seconds; nullopt = never
};

// Expired records are excluded from every read path.
inline bool is_active(const MemoryRecord& record, uint64_t now) {
    return !record.expires_at || *record.expires_at > now;
}

// What the retrieval engine hands back for prompt injection.
struct RetrievedMemory {
    std::string key;
    std::string value;
    MemoryCategory category = MemoryCategory::General;

    bool operator==(const RetrievedMemory& o) const {
        return key == o.key && value == o.value && category == o.category;
    }
    bool operator!=(const RetrievedMemory& o) const { return !(*this == o); }
};

// Abstract store of per-agent memory records.
// Read methods only ever return active (non-expired at `now`) records.
// List order is insertion order per agent; upserts keep the original position.
// All methods throw DependencyUnavailable on backend failure.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual std::string backend_name() const = 0;

    // Number of active records for the agent.
    virtual uint32_t count_active(const std::string& agent_id, uint64_t now,
                                  const CallContext& ctx = {}) = 0;

    // Active records for the agent, restricted to a group (nullopt = all).
    virtual std::vector<MemoryRecord> list_active(const std::string& agent_id,
                                                  std::optional<MemoryGroup> group,
                                                  uint64_t now,
                                                  const CallContext& ctx = {}) = 0;

    // Insert or replace the record keyed by (agent_id, record.key).
    virtual void upsert(const std::string& agent_id, const MemoryRecord& record) = 0;

    // Exact lookup, regardless of expiry.
    virtual std::optional<MemoryRecord> get(const std::string& agent_id,
                                            const std::string& key) = 0;

    // Delete a record. Returns true if it existed.
    virtual bool forget(const std::string& agent_id, const std::string& key) = 0;

    // Physically delete every record whose expiry is at or before `now`.
    // Returns count purged.
    virtual uint32_t purge_expired(uint64_t now) = 0;
};

// Category string conversions (wire names: INSTRUCTION, STYLE_CORRECTION, ...)
std::string category_to_string(MemoryCategory cat);
std::optional<MemoryCategory> category_from_string(const std::string& s);

std::string group_to_string(MemoryGroup group);

// Create a store backend from config.
struct Config;
std::unique_ptr<MemoryStore> create_store(const Config& config);

} // namespace agentmem
