#include "memory_writer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <iostream>
#include <limits>

namespace agentmem {

MemoryWriter::MemoryWriter(MemoryStore& store, Embedder* embedder, Clock clock)
    : store_(store)
    , embedder_(embedder)
    , clock_(clock ? std::move(clock) : Clock(epoch_seconds))
{}

// Saturates at the largest timestamp SQLite can hold (a signed 64-bit
// INTEGER), so a huge TTL means "never" in every store.
static uint64_t expiry_after(uint64_t now, uint64_t ttl_seconds) {
    constexpr uint64_t kMaxTimestamp = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (now >= kMaxTimestamp || ttl_seconds > kMaxTimestamp - now) return kMaxTimestamp;
    return now + ttl_seconds;
}

std::string MemoryWriter::embedding_text(const std::string& key, const std::string& value) {
    return key + ": " + value;
}

MemoryRecord MemoryWriter::remember(const std::string& agent_id,
                                    const std::string& key,
                                    const std::string& value,
                                    MemoryCategory category,
                                    std::optional<uint64_t> ttl_seconds,
                                    const CallContext& ctx) {
    if (trim(agent_id).empty()) throw ValidationError("agent_id must not be empty");
    if (trim(key).empty()) throw ValidationError("memory key must not be empty");

    MemoryRecord record;
    record.key = key;
    record.value = value;
    record.category = category;

    // Embed before stamping so a slow provider does not age the record
    if (embedder_) {
        try {
            record.embedding = embedder_->embed(embedding_text(key, value), ctx);
        } catch (const DependencyUnavailable& e) {
            std::cerr << "[writer] Storing '" << key << "' without embedding: "
                      << e.what() << "\n";
        }
    }

    record.updated_at = clock_();
    if (ttl_seconds) record.expires_at = expiry_after(record.updated_at, *ttl_seconds);

    store_.upsert(agent_id, record);
    return record;
}

uint32_t MemoryWriter::reembed_missing(const std::string& agent_id, const CallContext& ctx) {
    if (trim(agent_id).empty()) throw ValidationError("agent_id must not be empty");
    if (!embedder_) throw DependencyUnavailable("no embedding provider configured");

    auto records = store_.list_active(agent_id, std::nullopt, clock_(), ctx);
    uint32_t updated = 0;
    for (auto& record : records) {
        if (record.embedding && !record.embedding->empty()) continue;
        record.embedding = embedder_->embed(embedding_text(record.key, record.value), ctx);
        store_.upsert(agent_id, record);
        updated++;
    }
    return updated;
}

} // namespace agentmem
