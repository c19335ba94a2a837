#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace agentmem {

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;
    long timeout_ms = static_cast<long>(emb.timeout_ms);

    // Resolve provider: explicit config, or auto-detect from an available API key
    std::string provider = emb.provider;
    if (provider.empty()) {
        if (!emb.api_key.empty()) {
            provider = "openai";
            std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
        }
    }
    if (provider.empty()) return nullptr;

    if (provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, emb.model, timeout_ms);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model, timeout_ms);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace agentmem
