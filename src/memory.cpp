#include "memory.hpp"
#include "config.hpp"
#include "util.hpp"
#include "memory/json_store.hpp"
#ifdef AGENTMEM_HAS_SQLITE_STORE
#include "memory/sqlite_store.hpp"
#endif
#include <iostream>

namespace agentmem {

// No default: a new category must be classified here or -Wswitch fires.
MemoryGroup group_of(MemoryCategory category) {
    switch (category) {
        case MemoryCategory::Instruction:
        case MemoryCategory::Preference:
        case MemoryCategory::StyleCorrection:
            return MemoryGroup::Core;
        case MemoryCategory::General:
        case MemoryCategory::Context:
        case MemoryCategory::History:
            return MemoryGroup::Contextual;
    }
    return MemoryGroup::Contextual;
}

std::string category_to_string(MemoryCategory cat) {
    switch (cat) {
        case MemoryCategory::Instruction:     return "INSTRUCTION";
        case MemoryCategory::Preference:      return "PREFERENCE";
        case MemoryCategory::StyleCorrection: return "STYLE_CORRECTION";
        case MemoryCategory::General:         return "GENERAL";
        case MemoryCategory::Context:         return "CONTEXT";
        case MemoryCategory::History:         return "HISTORY";
    }
    return "GENERAL";
}

std::optional<MemoryCategory> category_from_string(const std::string& s) {
    std::string v = to_upper(trim(s));
    if (v == "INSTRUCTION")      return MemoryCategory::Instruction;
    if (v == "PREFERENCE")       return MemoryCategory::Preference;
    if (v == "STYLE_CORRECTION") return MemoryCategory::StyleCorrection;
    if (v == "GENERAL")          return MemoryCategory::General;
    if (v == "CONTEXT")          return MemoryCategory::Context;
    if (v == "HISTORY")          return MemoryCategory::History;
    return std::nullopt;
}

std::string group_to_string(MemoryGroup group) {
    switch (group) {
        case MemoryGroup::Core:       return "core";
        case MemoryGroup::Contextual: return "contextual";
    }
    return "contextual";
}

std::unique_ptr<MemoryStore> create_store(const Config& config) {
    const auto& backend = config.store.backend;

#ifdef AGENTMEM_HAS_SQLITE_STORE
    if (backend == "sqlite") {
        std::string path = config.store.path;
        if (path.empty()) path = expand_home("~/.agentmem/memory.db");
        return std::make_unique<SqliteStore>(path);
    }
#endif

    if (backend == "json") {
        std::string path = config.store.path;
        if (path.empty()) path = expand_home("~/.agentmem/memory.json");
        return std::make_unique<JsonStore>(path);
    }

    std::cerr << "[store] Unknown or unavailable store backend: " << backend << "\n";
    return nullptr;
}

} // namespace agentmem
