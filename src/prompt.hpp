#pragma once
#include "memory.hpp"
#include <string>
#include <vector>

namespace agentmem {

// Render retrieved memories as the "## Memories" system prompt section:
//   ## Memories
//   - key: value
// Returns an empty string when there is nothing to inject.
std::string format_memories_section(const std::vector<RetrievedMemory>& memories);

} // namespace agentmem
