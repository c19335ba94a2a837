#include "extraction.hpp"
#include "memory_writer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

namespace agentmem {

static constexpr size_t kMinUserMessageLength = 20;
static constexpr size_t kMaxAssistantChars = 1000;
static constexpr size_t kMaxToolResultChars = 500;

// Length in UTF-16 code units, so characters outside the BMP count twice.
// Continuation bytes are skipped.
static size_t text_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) == 0x80) continue;
        n += (c >= 0xF0) ? 2 : 1;
    }
    return n;
}

bool should_extract(const std::string& user_message, size_t tool_result_count) {
    return text_length(user_message) >= kMinUserMessageLength || tool_result_count > 0;
}

std::string build_extraction_prompt(const std::string& user_message,
                                    const std::string& assistant_response,
                                    const std::vector<ToolResult>& tool_results,
                                    const std::vector<RetrievedMemory>& existing) {
    std::ostringstream ss;

    ss << "You are a memory extraction system. Extract important facts from the "
       << "conversation turn below that should be remembered for future conversations.\n\n"
       << "Focus on:\n"
       << "- User preferences (timezone, language, tone, format)\n"
       << "- Standing instructions (\"always do X\", \"never do Y\")\n"
       << "- Task parameters (targets, search criteria, filters)\n"
       << "- Corrections the user made to the assistant's behavior\n\n"
       << "Do not extract greetings, acknowledgments, the assistant's reasoning, or "
       << "facts already captured in existing memories unless they changed.\n\n"
       << "Each fact needs:\n"
       << "- key: short snake_case identifier (e.g. \"preferred_language\")\n"
       << "- value: the fact, concise but complete\n"
       << "- category: one of PREFERENCE, INSTRUCTION, CONTEXT, HISTORY, GENERAL\n\n"
       << "To update an existing memory, reuse its key.\n"
       << "Output ONLY a JSON array: [{\"key\":\"...\",\"value\":\"...\",\"category\":\"...\"}]\n"
       << "Output [] if nothing is worth remembering.\n\n";

    if (!existing.empty()) {
        ss << "Existing memories:\n";
        for (const auto& m : existing) {
            ss << "- " << m.key << ": " << m.value << "\n";
        }
        ss << "\n";
    }

    ss << "User message: " << user_message << "\n\n"
       << "Assistant response: " << assistant_response.substr(0, kMaxAssistantChars) << "\n";

    if (!tool_results.empty()) {
        ss << "\nTool results from this turn:\n";
        for (const auto& t : tool_results) {
            // ASCII-escaped so the cut never splits a multi-byte character
            std::string output = t.output.dump(-1, ' ', true,
                                               nlohmann::json::error_handler_t::replace);
            ss << "- " << t.name << ": " << output.substr(0, kMaxToolResultChars) << "\n";
        }
    }
    return ss.str();
}

// Categories the extraction model may assign. STYLE_CORRECTION is written by
// a separate path and is not accepted here.
static bool extractable(MemoryCategory category) {
    switch (category) {
        case MemoryCategory::General:
        case MemoryCategory::Preference:
        case MemoryCategory::Context:
        case MemoryCategory::History:
        case MemoryCategory::Instruction:
            return true;
        case MemoryCategory::StyleCorrection:
            return false;
    }
    return false;
}

std::vector<ExtractedMemory> parse_extracted_memories(const std::string& text) {
    std::vector<ExtractedMemory> result;

    auto start = text.find('[');
    auto end = text.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return result;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.substr(start, end - start + 1));
    } catch (const nlohmann::json::exception&) {
        return result;
    }
    if (!j.is_array()) return result;

    for (const auto& item : j) {
        if (!item.is_object()) continue;
        if (!item.contains("key") || !item["key"].is_string()) continue;
        if (!item.contains("value") || !item["value"].is_string()) continue;
        if (!item.contains("category") || !item["category"].is_string()) continue;

        // Model output is expected in upper case; anything else is rejected
        std::string cat_name = item["category"].get<std::string>();
        auto category = category_from_string(cat_name);
        if (!category || cat_name != category_to_string(*category)) continue;
        if (!extractable(*category)) continue;

        ExtractedMemory m;
        m.key = item["key"].get<std::string>();
        m.value = item["value"].get<std::string>();
        m.category = *category;
        if (m.key.empty()) continue;
        result.push_back(std::move(m));
    }
    return result;
}

size_t save_extracted(MemoryWriter& writer, const std::string& agent_id,
                      const std::vector<ExtractedMemory>& memories,
                      const CallContext& ctx) {
    if (trim(agent_id).empty()) throw ValidationError("agent_id must not be empty");

    size_t saved = 0;
    for (const auto& m : memories) {
        try {
            writer.remember(agent_id, m.key, m.value, m.category, std::nullopt, ctx);
            saved++;
        } catch (const std::exception& e) {
            std::cerr << "[writer] Failed to save extracted memory '" << m.key
                      << "': " << e.what() << "\n";
        }
    }
    return saved;
}

} // namespace agentmem
