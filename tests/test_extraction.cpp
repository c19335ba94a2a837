#include <catch2/catch_test_macros.hpp>
#include "extraction.hpp"
#include "memory_writer.hpp"
#include "errors.hpp"
#include "mock_store.hpp"
#include <nlohmann/json.hpp>

using namespace agentmem;

// ── should_extract ───────────────────────────────────────────

TEST_CASE("should_extract: short message without tools is skipped", "[extraction]") {
    REQUIRE_FALSE(should_extract("thanks!", 0));
    REQUIRE_FALSE(should_extract(std::string(19, 'x'), 0));
}

TEST_CASE("should_extract: long message or tool activity", "[extraction]") {
    REQUIRE(should_extract(std::string(20, 'x'), 0));
    REQUIRE(should_extract("ok", 1));
}

TEST_CASE("should_extract: length counts characters, not bytes", "[extraction]") {
    // Ten two-byte characters: 20 bytes but only 10 characters
    std::string umlauts;
    for (int i = 0; i < 10; i++) umlauts += "\xC3\xA4";
    REQUIRE(umlauts.size() == 20);
    REQUIRE_FALSE(should_extract(umlauts, 0));

    // Six three-byte characters: 18 bytes, 6 characters
    std::string kana;
    for (int i = 0; i < 6; i++) kana += "\xE3\x81\x82";
    REQUIRE_FALSE(should_extract(kana + std::string(13, 'x'), 0));
    REQUIRE(should_extract(kana + std::string(14, 'x'), 0));

    // Characters outside the BMP count as two, as in UTF-16
    std::string emoji;
    for (int i = 0; i < 10; i++) emoji += "\xF0\x9F\x98\x80";
    REQUIRE(should_extract(emoji, 0));
}

// ── build_extraction_prompt ──────────────────────────────────

TEST_CASE("build_extraction_prompt: includes turn and existing memories", "[extraction]") {
    std::vector<RetrievedMemory> existing = {
        {"timezone", "UTC+2", MemoryCategory::Preference}
    };
    auto prompt = build_extraction_prompt("I moved to Tokyo", "Noted.", {}, existing);

    REQUIRE(prompt.find("Existing memories:") != std::string::npos);
    REQUIRE(prompt.find("- timezone: UTC+2") != std::string::npos);
    REQUIRE(prompt.find("User message: I moved to Tokyo") != std::string::npos);
    REQUIRE(prompt.find("Assistant response: Noted.") != std::string::npos);
    REQUIRE(prompt.find("JSON array") != std::string::npos);
}

TEST_CASE("build_extraction_prompt: no existing section when empty", "[extraction]") {
    auto prompt = build_extraction_prompt("hello there", "hi", {}, {});
    REQUIRE(prompt.find("Existing memories:") == std::string::npos);
}

TEST_CASE("build_extraction_prompt: long assistant response is truncated", "[extraction]") {
    std::string response(1000, 'a');
    response += std::string(500, 'b');
    auto prompt = build_extraction_prompt("question", response, {}, {});
    REQUIRE(prompt.find(std::string(1000, 'a')) != std::string::npos);
    REQUIRE(prompt.find(std::string(1000, 'a') + "b") == std::string::npos);
    REQUIRE(prompt.find("bbb") == std::string::npos);
}

TEST_CASE("build_extraction_prompt: lists tool results after the turn", "[extraction]") {
    std::vector<ToolResult> tools = {
        {"web_search", nlohmann::json{{"hits", 3}}},
        {"clock", nlohmann::json("12:00")},
    };
    auto prompt = build_extraction_prompt("find me flights to Oslo", "Found three.", tools, {});

    auto section = prompt.find("Tool results from this turn:\n");
    REQUIRE(section != std::string::npos);
    REQUIRE(section > prompt.find("Assistant response: Found three."));
    REQUIRE(prompt.find("- web_search: {\"hits\":3}\n") != std::string::npos);
    REQUIRE(prompt.find("- clock: \"12:00\"\n") != std::string::npos);
}

TEST_CASE("build_extraction_prompt: no tool section without tool calls", "[extraction]") {
    auto prompt = build_extraction_prompt("what is the weather like", "Sunny.", {}, {});
    REQUIRE(prompt.find("Tool results from this turn:") == std::string::npos);
}

TEST_CASE("build_extraction_prompt: each tool output is cut to 500 characters", "[extraction]") {
    std::vector<ToolResult> tools = {
        {"read_file", nlohmann::json(std::string(800, 'z'))},
        {"ls", nlohmann::json::array({"a.txt"})},
    };
    auto prompt = build_extraction_prompt("summarize the file", "Done.", tools, {});

    // Serialized output starts with a quote, leaving 499 characters of content
    REQUIRE(prompt.find("- read_file: \"" + std::string(499, 'z') + "\n") != std::string::npos);
    REQUIRE(prompt.find(std::string(500, 'z')) == std::string::npos);
    REQUIRE(prompt.find("- ls: [\"a.txt\"]\n") != std::string::npos);
}

// ── parse_extracted_memories ─────────────────────────────────

TEST_CASE("parse_extracted_memories: plain array", "[extraction]") {
    auto items = parse_extracted_memories(
        R"([{"key":"lang","value":"Rust","category":"PREFERENCE"},
            {"key":"trip","value":"Lisbon","category":"CONTEXT"}])");
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].key == "lang");
    REQUIRE(items[0].category == MemoryCategory::Preference);
    REQUIRE(items[1].category == MemoryCategory::Context);
}

TEST_CASE("parse_extracted_memories: tolerates fences and prose", "[extraction]") {
    auto items = parse_extracted_memories(
        "Here you go:\n```json\n[{\"key\":\"k\",\"value\":\"v\",\"category\":\"GENERAL\"}]\n```");
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].value == "v");
}

TEST_CASE("parse_extracted_memories: drops invalid items", "[extraction]") {
    auto items = parse_extracted_memories(R"([
        {"key":"ok","value":"v","category":"HISTORY"},
        {"key":"","value":"v","category":"GENERAL"},
        {"key":"no_value","category":"GENERAL"},
        {"key":"lower","value":"v","category":"general"},
        {"key":"style","value":"v","category":"STYLE_CORRECTION"},
        {"key":"bogus","value":"v","category":"KNOWLEDGE"},
        {"key":"num","value":3,"category":"GENERAL"},
        "string item"
    ])");
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].key == "ok");
}

TEST_CASE("parse_extracted_memories: malformed input yields empty", "[extraction]") {
    REQUIRE(parse_extracted_memories("").empty());
    REQUIRE(parse_extracted_memories("nothing to remember").empty());
    REQUIRE(parse_extracted_memories("[not json]").empty());
    REQUIRE(parse_extracted_memories("] backwards [").empty());
    REQUIRE(parse_extracted_memories("[]").empty());
}

// ── save_extracted ───────────────────────────────────────────

TEST_CASE("save_extracted: upserts every item", "[extraction]") {
    MockStore store;
    MemoryWriter writer(store, nullptr, [] { return uint64_t{1000}; });

    std::vector<ExtractedMemory> items = {
        {"lang", "Rust", MemoryCategory::Preference},
        {"trip", "Lisbon", MemoryCategory::Context},
        {"", "bad", MemoryCategory::General},
    };
    REQUIRE(save_extracted(writer, "a1", items) == 2);
    REQUIRE(store.get("a1", "lang")->category == MemoryCategory::Preference);
    REQUIRE(store.get("a1", "trip").has_value());
}

TEST_CASE("save_extracted: empty agent is a ValidationError", "[extraction]") {
    MockStore store;
    MemoryWriter writer(store, nullptr);
    REQUIRE_THROWS_AS(save_extracted(writer, "", {}), ValidationError);
}
