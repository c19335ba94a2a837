#pragma once
#include "memory.hpp"
#include "call_context.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentmem {

class MemoryWriter;

// A fact proposed by the extraction model for one conversation turn.
struct ExtractedMemory {
    std::string key;
    std::string value;
    MemoryCategory category = MemoryCategory::General;
};

// Output of one tool call made during the turn.
struct ToolResult {
    std::string name;
    nlohmann::json output;
};

// Short user messages without tool activity carry nothing worth remembering.
// Length is counted in characters (UTF-8 code points), not bytes.
bool should_extract(const std::string& user_message, size_t tool_result_count);

// Prompt asking a model to extract facts from one turn as a JSON array.
// Tool results are listed one per line, each serialized and cut to 500
// characters. Existing memories are listed so the model reuses their keys.
std::string build_extraction_prompt(const std::string& user_message,
                                    const std::string& assistant_response,
                                    const std::vector<ToolResult>& tool_results,
                                    const std::vector<RetrievedMemory>& existing);

// Parse the model's reply. Tolerates surrounding prose or code fences; items
// with missing fields or an unsupported category are dropped. Malformed
// input yields an empty list.
std::vector<ExtractedMemory> parse_extracted_memories(const std::string& text);

// Upsert every extracted memory. A failing item is logged and skipped.
// Throws ValidationError for an empty agent id.
// Returns the number saved.
size_t save_extracted(MemoryWriter& writer, const std::string& agent_id,
                      const std::vector<ExtractedMemory>& memories,
                      const CallContext& ctx = {});

} // namespace agentmem
