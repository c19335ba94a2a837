#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentmem {

// File-backed store: the whole data set is one JSON array rewritten
// atomically after every write. Suited to small deployments and tests.
class JsonStore : public MemoryStore {
public:
    explicit JsonStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    uint32_t count_active(const std::string& agent_id, uint64_t now,
                          const CallContext& ctx = {}) override;

    std::vector<MemoryRecord> list_active(const std::string& agent_id,
                                          std::optional<MemoryGroup> group,
                                          uint64_t now,
                                          const CallContext& ctx = {}) override;

    void upsert(const std::string& agent_id, const MemoryRecord& record) override;

    std::optional<MemoryRecord> get(const std::string& agent_id,
                                    const std::string& key) override;

    bool forget(const std::string& agent_id, const std::string& key) override;

    uint32_t purge_expired(uint64_t now) override;

private:
    struct Entry {
        std::string agent_id;
        MemoryRecord record;
    };

    void load();
    void save();
    void rebuild_index();
    static std::string index_key(const std::string& agent_id, const std::string& key);

    std::string path_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> key_index_;
    mutable std::mutex mutex_;
};

} // namespace agentmem
