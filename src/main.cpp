#include "config.hpp"
#include "memory.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "retrieval.hpp"
#include "memory_writer.hpp"
#include "prompt.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: agentmem COMMAND [options]\n"
              << "\n"
              << "Commands:\n"
              << "  remember             Store or update a memory (--agent --key --value [--category] [--ttl])\n"
              << "  recall               Print the memories selected for a message (--agent --message)\n"
              << "  list                 List an agent's active memories (--agent)\n"
              << "  forget               Delete a memory (--agent --key)\n"
              << "  purge                Delete all expired memories\n"
              << "  reembed              Compute missing embeddings (--agent)\n"
              << "\n"
              << "Options:\n"
              << "  -a, --agent ID       Agent identifier\n"
              << "  -k, --key KEY        Memory key\n"
              << "  -v, --value TEXT     Memory value\n"
              << "  -c, --category CAT   INSTRUCTION, PREFERENCE, STYLE_CORRECTION,\n"
              << "                       GENERAL (default), CONTEXT, HISTORY\n"
              << "  --ttl SECONDS        Expire the memory after SECONDS\n"
              << "  -m, --message TEXT   Current user message (recall)\n"
              << "  --timeout-ms MS      Deadline for store and embedding calls\n"
              << "  --explain            Show retrieval path and scores (recall)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY                API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL               Base URL for Ollama embeddings\n"
              << "  AGENTMEM_EMBEDDINGS_PROVIDER  openai or ollama\n"
              << "  AGENTMEM_STORE_BACKEND        sqlite or json\n"
              << "  AGENTMEM_STORE_PATH           Store file location\n";
}

struct CliOptions {
    std::string command;
    std::string agent;
    std::string key;
    std::string value;
    std::string category = "GENERAL";
    std::string message;
    std::optional<uint64_t> ttl;
    long timeout_ms = 0;
    bool explain = false;
};

static bool parse_number(const char* s, uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || s[0] == '-' || s[0] == '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

// Returns 0 on success, otherwise the exit code for a usage error.
static int parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage();
            return -1;
        } else if ((std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "--agent") == 0) && has_value) {
            opts.agent = argv[++i];
        } else if ((std::strcmp(arg, "-k") == 0 || std::strcmp(arg, "--key") == 0) && has_value) {
            opts.key = argv[++i];
        } else if ((std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--value") == 0) && has_value) {
            opts.value = argv[++i];
        } else if ((std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--category") == 0) && has_value) {
            opts.category = argv[++i];
        } else if ((std::strcmp(arg, "-m") == 0 || std::strcmp(arg, "--message") == 0) && has_value) {
            opts.message = argv[++i];
        } else if (std::strcmp(arg, "--ttl") == 0 && has_value) {
            uint64_t ttl = 0;
            if (!parse_number(argv[++i], ttl)) {
                std::cerr << "Invalid --ttl: " << argv[i] << "\n";
                return 2;
            }
            opts.ttl = ttl;
        } else if (std::strcmp(arg, "--timeout-ms") == 0 && has_value) {
            uint64_t ms = 0;
            if (!parse_number(argv[++i], ms) || ms == 0) {
                std::cerr << "Invalid --timeout-ms: " << argv[i] << "\n";
                return 2;
            }
            opts.timeout_ms = static_cast<long>(ms);
        } else if (std::strcmp(arg, "--explain") == 0) {
            opts.explain = true;
        } else if (arg[0] != '-' && opts.command.empty()) {
            opts.command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        }
    }
    if (opts.command.empty()) {
        print_usage();
        return 2;
    }
    return 0;
}

static void print_explain(const agentmem::RetrievalResult& result) {
    std::cerr << "path: " << agentmem::path_to_string(result.path)
              << ", active: " << result.active_count
              << ", core: " << result.core_count
              << ", contextual candidates: " << result.contextual_candidates
              << ", anomalies: " << result.anomalies << "\n";
    std::cerr << std::fixed << std::setprecision(3);
    for (const auto& m : result.ranked) {
        std::cerr << "  " << m.key << "  score=" << m.score
                  << " (semantic=" << m.parts.semantic
                  << " recency=" << m.parts.recency
                  << " importance=" << m.parts.importance << ")\n";
    }
}

static int run_command(const CliOptions& opts, const agentmem::Config& config,
                       agentmem::MemoryStore& store, agentmem::Embedder* embedder,
                       const agentmem::CallContext& ctx) {
    using namespace agentmem;

    if (opts.command == "remember") {
        auto category = category_from_string(opts.category);
        if (!category) {
            std::cerr << "Unknown category: " << opts.category << "\n";
            return 2;
        }
        MemoryWriter writer(store, embedder);
        auto record = writer.remember(opts.agent, opts.key, opts.value, *category, opts.ttl, ctx);
        std::cout << "Stored " << record.key << " (" << category_to_string(record.category)
                  << (record.embedding ? ", embedded" : ", no embedding") << ")\n";
        return 0;
    }

    if (opts.command == "recall") {
        RetrievalEngine engine(store, embedder, config.retrieval);
        auto result = engine.retrieve_detailed(opts.agent, opts.message, ctx);
        if (opts.explain) print_explain(result);
        std::string section = format_memories_section(result.memories);
        if (!section.empty()) std::cout << section << "\n";
        return 0;
    }

    if (opts.command == "list") {
        if (trim(opts.agent).empty()) throw ValidationError("agent_id must not be empty");
        auto records = store.list_active(opts.agent, std::nullopt, epoch_seconds(), ctx);
        for (const auto& r : records) {
            std::cout << r.key << "\t" << category_to_string(r.category) << "\t"
                      << group_to_string(group_of(r.category)) << "\t"
                      << (r.embedding ? std::to_string(r.embedding->size()) + "d" : "-")
                      << "\t" << r.value << "\n";
        }
        return 0;
    }

    if (opts.command == "forget") {
        if (trim(opts.agent).empty()) throw ValidationError("agent_id must not be empty");
        if (!store.forget(opts.agent, opts.key)) {
            std::cerr << "No memory '" << opts.key << "' for agent " << opts.agent << "\n";
            return 1;
        }
        std::cout << "Forgot " << opts.key << "\n";
        return 0;
    }

    if (opts.command == "purge") {
        uint32_t purged = store.purge_expired(epoch_seconds());
        std::cout << "Purged " << purged << " expired memories\n";
        return 0;
    }

    if (opts.command == "reembed") {
        MemoryWriter writer(store, embedder);
        uint32_t updated = writer.reembed_missing(opts.agent, ctx);
        std::cout << "Embedded " << updated << " memories\n";
        return 0;
    }

    std::cerr << "Unknown command: " << opts.command << "\n";
    print_usage();
    return 2;
}

int main(int argc, char* argv[]) try {
    CliOptions opts;
    int rc = parse_args(argc, argv, opts);
    if (rc == -1) return 0;
    if (rc != 0) return rc;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    agentmem::http_init();
    auto config = agentmem::Config::load();

    auto store = agentmem::create_store(config);
    if (!store) {
        agentmem::http_cleanup();
        return 1;
    }

    agentmem::CurlHttpClient http_client;
    auto embedder = agentmem::create_embedder(config, http_client);

    agentmem::CallContext ctx;
    if (opts.timeout_ms > 0) {
        ctx = agentmem::CallContext::within(std::chrono::milliseconds(opts.timeout_ms), &g_shutdown);
    } else {
        ctx.cancel = &g_shutdown;
    }

    try {
        rc = run_command(opts, config, *store, embedder.get(), ctx);
    } catch (const agentmem::ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 2;
    } catch (const agentmem::DependencyUnavailable& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    agentmem::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
