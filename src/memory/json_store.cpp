#include "json_store.hpp"
#include "record_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace agentmem {

JsonStore::JsonStore(const std::string& path) : path_(path) {
    load();
}

std::string JsonStore::index_key(const std::string& agent_id, const std::string& key) {
    std::string k;
    k.reserve(agent_id.size() + key.size() + 1);
    k += agent_id;
    k += '\x1f';
    k += key;
    return k;
}

void JsonStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) {
            std::cerr << "[json] " << path_ << " is not a JSON array, starting empty\n";
            return;
        }

        entries_.clear();
        entries_.reserve(j.size());
        size_t skipped = 0;
        for (const auto& item : j) {
            auto record = record_from_json(item);
            auto agent = record ? item.find("agent_id") : item.end();
            if (agent == item.end() || !agent->is_string() ||
                agent->get<std::string>().empty()) {
                skipped++;
                continue;
            }
            entries_.push_back({agent->get<std::string>(), std::move(*record)});
        }
        if (skipped > 0) {
            std::cerr << "[json] Skipped " << skipped << " unreadable entries in "
                      << path_ << "\n";
        }
        rebuild_index();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[json] Corrupt store " << path_ << " (" << e.what()
                  << "), starting empty\n";
        entries_.clear();
        key_index_.clear();
    }
}

void JsonStore::save() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : entries_) {
        j.push_back(record_to_json(entry.agent_id, entry.record));
    }
    if (!atomic_write_file(path_, j.dump(2))) {
        throw DependencyUnavailable("JsonStore: failed to write " + path_);
    }
}

void JsonStore::rebuild_index() {
    key_index_.clear();
    key_index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        key_index_[index_key(entries_[i].agent_id, entries_[i].record.key)] = i;
    }
}

uint32_t JsonStore::count_active(const std::string& agent_id, uint64_t now,
                                 const CallContext& ctx) {
    ctx.check("json store");
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t n = 0;
    for (const auto& entry : entries_) {
        if (entry.agent_id == agent_id && is_active(entry.record, now)) n++;
    }
    return n;
}

std::vector<MemoryRecord> JsonStore::list_active(const std::string& agent_id,
                                                 std::optional<MemoryGroup> group,
                                                 uint64_t now,
                                                 const CallContext& ctx) {
    ctx.check("json store");
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MemoryRecord> result;
    for (const auto& entry : entries_) {
        if (entry.agent_id != agent_id) continue;
        if (!is_active(entry.record, now)) continue;
        if (group && group_of(entry.record.category) != *group) continue;
        result.push_back(entry.record);
    }
    return result;
}

void JsonStore::upsert(const std::string& agent_id, const MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = key_index_.find(index_key(agent_id, record.key));
    if (it != key_index_.end()) {
        entries_[it->second].record = record;
    } else {
        key_index_[index_key(agent_id, record.key)] = entries_.size();
        entries_.push_back({agent_id, record});
    }
    save();
}

std::optional<MemoryRecord> JsonStore::get(const std::string& agent_id,
                                           const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = key_index_.find(index_key(agent_id, key));
    if (it != key_index_.end()) return entries_[it->second].record;
    return std::nullopt;
}

bool JsonStore::forget(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = key_index_.find(index_key(agent_id, key));
    if (it == key_index_.end()) return false;

    entries_.erase(entries_.begin() + static_cast<ptrdiff_t>(it->second));
    rebuild_index();
    save();
    return true;
}

uint32_t JsonStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t purged = 0;
    auto it = entries_.begin();
    while (it != entries_.end()) {
        if (!is_active(it->record, now)) {
            it = entries_.erase(it);
            purged++;
        } else {
            ++it;
        }
    }

    if (purged > 0) {
        rebuild_index();
        save();
    }
    return purged;
}

} // namespace agentmem
