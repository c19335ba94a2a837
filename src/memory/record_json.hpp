#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentmem {

// Shared JSON <-> MemoryRecord conversion used by JsonStore.
// "embedding": null means not computed; [] is a genuine empty vector.
//
// record_from_json returns nullopt for an item that cannot be a record (wrong field types,
// missing key, unknown category) so one bad entry never poisons a load.
inline std::optional<MemoryRecord> record_from_json(const nlohmann::json& item) {
    if (!item.is_object()) return std::nullopt;

    auto key = item.find("key");
    if (key == item.end() || !key->is_string()) return std::nullopt;

    MemoryRecord record;
    record.key = key->get<std::string>();
    if (record.key.empty()) return std::nullopt;

    auto value = item.find("value");
    if (value != item.end()) {
        if (!value->is_string()) return std::nullopt;
        record.value = value->get<std::string>();
    }

    std::string cat_name = "GENERAL";
    auto cat = item.find("category");
    if (cat != item.end()) {
        if (!cat->is_string()) return std::nullopt;
        cat_name = cat->get<std::string>();
    }
    auto category = category_from_string(cat_name);
    if (!category) return std::nullopt;
    record.category = *category;

    auto emb = item.find("embedding");
    if (emb != item.end() && !emb->is_null()) {
        if (!emb->is_array()) return std::nullopt;
        Embedding values;
        values.reserve(emb->size());
        for (const auto& v : *emb) {
            if (!v.is_number()) return std::nullopt;
            values.push_back(v.get<float>());
        }
        record.embedding = std::move(values);
    }

    auto updated = item.find("updated_at");
    if (updated != item.end()) {
        if (!updated->is_number_unsigned()) return std::nullopt;
        record.updated_at = updated->get<uint64_t>();
    }

    auto expires = item.find("expires_at");
    if (expires != item.end() && !expires->is_null()) {
        if (!expires->is_number_unsigned()) return std::nullopt;
        record.expires_at = expires->get<uint64_t>();
    }
    return record;
}

inline nlohmann::json record_to_json(const std::string& agent_id, const MemoryRecord& record) {
    nlohmann::json item = {
        {"agent_id", agent_id},
        {"key", record.key},
        {"value", record.value},
        {"category", category_to_string(record.category)},
        {"updated_at", record.updated_at}
    };
    item["embedding"] = record.embedding ? nlohmann::json(*record.embedding) : nlohmann::json();
    item["expires_at"] = record.expires_at ? nlohmann::json(*record.expires_at) : nlohmann::json();
    return item;
}

} // namespace agentmem
