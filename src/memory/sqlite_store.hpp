#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace agentmem {

class SqliteStore : public MemoryStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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
    void init_schema();
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace agentmem
