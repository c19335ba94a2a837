#include "prompt.hpp"
#include <sstream>

namespace agentmem {

std::string format_memories_section(const std::vector<RetrievedMemory>& memories) {
    if (memories.empty()) return "";

    std::ostringstream ss;
    ss << "## Memories\n";
    for (size_t i = 0; i < memories.size(); i++) {
        if (i > 0) ss << "\n";
        ss << "- " << memories[i].key << ": " << memories[i].value;
    }
    return ss.str();
}

} // namespace agentmem
