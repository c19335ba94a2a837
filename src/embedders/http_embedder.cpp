#include "http_embedder.hpp"
#include <nlohmann/json.hpp>

namespace agentmem {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEmbedder::embed(const std::string& text, const CallContext& ctx) {
    const std::string what = config_.name + " embedder";
    ctx.check(what);

    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(config_.base_url + config_.endpoint, body.dump(), headers,
                               ctx.remaining_ms(config_.timeout_ms), ctx.cancel);

    if (response.status_code == 0) {
        ctx.check(what);
        throw DependencyUnavailable(what + ": request failed (transport error or timeout)");
    }
    if (response.status_code != 200) {
        throw DependencyUnavailable(what + ": HTTP " + std::to_string(response.status_code));
    }

    Embedding result;
    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw DependencyUnavailable(what + ": malformed response: " + e.what());
    }

    if (result.empty()) {
        throw DependencyUnavailable(what + ": empty embedding in response");
    }
    dimensions_.store(static_cast<uint32_t>(result.size()));
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model,
    long timeout_ms) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = 1536;
    cfg.timeout_ms = timeout_ms;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_ms) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = 768;
    cfg.timeout_ms = timeout_ms;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace agentmem
