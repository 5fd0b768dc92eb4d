#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>

using json = nlohmann::json;

std::vector<float> Embedder::encode_one(const std::string& text) const {
    auto out = encode({text}, 1);
    if (out.size() != 1) throw EmbeddingError("embedder returned " + std::to_string(out.size()) + " vectors for 1 text");
    return std::move(out.front());
}

uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

// ---- HashingEmbedder ----

HashingEmbedder::HashingEmbedder(std::size_t dim) : dim_(dim) {
    if (dim_ == 0) throw ConfigError("hashing embedder dimension must be positive");
}

std::string HashingEmbedder::model_name() const {
    return kPrefix + std::to_string(dim_);
}

std::vector<float> HashingEmbedder::embed(const std::string& text) const {
    if (!is_valid_utf8(text)) {
        throw EmbeddingError("text is not valid UTF-8: '" + truncate_for_log(text) + "'");
    }
    std::vector<float> vec(dim_, 0.0f);

    // Tokenize: lowercase, split on non-alphanumeric
    std::string token;
    auto flush = [&] {
        if (token.empty()) return;
        vec[fnv1a64(token) % dim_] += 1.0f;
        token.clear();
    };
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalnum(uc)) {
            token += static_cast<char>(std::tolower(uc));
        } else {
            flush();
        }
    }
    flush();

    float norm = 0.0f;
    for (float v : vec) norm += v * v;
    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& v : vec) v /= norm;
    }
    return vec;
}

std::vector<std::vector<float>> HashingEmbedder::encode(const std::vector<std::string>& texts,
                                                        std::size_t /*batch_size*/) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed(t));
    return out;
}

// ---- OllamaEmbedder ----

struct OllamaEmbedder::State {
    std::atomic<std::size_t> dim{0};
};

OllamaEmbedder::OllamaEmbedder(std::string model, std::string base_url, int timeout_ms, std::size_t expected_dim)
    : model_(std::move(model)), base_(std::move(base_url)), timeout_ms_(timeout_ms), state_(std::make_unique<State>()) {
    if (model_.empty()) throw ConfigError("ollama model name is empty");
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
    state_->dim.store(expected_dim);
}

OllamaEmbedder::~OllamaEmbedder() = default;

std::string OllamaEmbedder::model_name() const {
    return kPrefix + model_;
}

std::size_t OllamaEmbedder::dimension() const {
    return state_->dim.load();
}

void OllamaEmbedder::check_width(std::size_t width) const {
    if (width == 0) throw EmbeddingError("ollama returned an empty embedding");
    std::size_t expected = 0;
    // first reply fixes the width for the lifetime of this embedder
    if (state_->dim.compare_exchange_strong(expected, width)) return;
    if (expected != width) {
        throw EmbeddingError("ollama returned width " + std::to_string(width) + ", expected " + std::to_string(expected));
    }
}

std::vector<std::vector<float>> parse_ollama_embeddings(long status, const std::string& body,
                                                        std::size_t expected_count) {
    if (status < 200 || status >= 300) {
        throw EmbeddingError("embedding failed: status " + std::to_string(status) + ": " + truncate_for_log(body, 200));
    }
    std::vector<std::vector<float>> out;
    try {
        auto data = json::parse(body);
        const auto& embeddings = data.at("embeddings");
        if (!embeddings.is_array()) throw EmbeddingError("malformed embedding response: 'embeddings' is not an array");
        for (const auto& e : embeddings) {
            if (!e.is_array()) throw EmbeddingError("malformed embedding response: embedding is not an array");
            std::vector<float> vec;
            vec.reserve(e.size());
            for (const auto& v : e) {
                if (!v.is_number()) throw EmbeddingError("malformed embedding response: non-numeric component");
                vec.push_back(v.get<float>());
            }
            out.push_back(std::move(vec));
        }
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("malformed embedding response: ") + e.what());
    }
    if (out.size() != expected_count) {
        throw EmbeddingError("ollama returned " + std::to_string(out.size()) + " embeddings for " +
                             std::to_string(expected_count) + " inputs");
    }
    return out;
}

std::vector<std::vector<float>> OllamaEmbedder::decode_reply(long status, const std::string& body,
                                                             std::size_t expected_count) const {
    auto out = parse_ollama_embeddings(status, body, expected_count);
    for (const auto& v : out) check_width(v.size());
    return out;
}

std::vector<std::vector<float>> OllamaEmbedder::embed_batch(const std::vector<std::string>& batch) const {
    json body = {
        {"model", model_},
        {"input", batch}
    };
    auto r = http_post_json(base_ + "/api/embed", body.dump(), timeout_ms_);
    return decode_reply(r.status, r.body, batch.size());
}

std::vector<std::vector<float>> OllamaEmbedder::encode(const std::vector<std::string>& texts,
                                                       std::size_t batch_size) const {
    for (const auto& t : texts) {
        if (!is_valid_utf8(t)) throw EmbeddingError("text is not valid UTF-8: '" + truncate_for_log(t) + "'");
    }
    batch_size = std::max<std::size_t>(1, batch_size);
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); i += batch_size) {
        auto end = std::min(texts.size(), i + batch_size);
        std::vector<std::string> batch(texts.begin() + i, texts.begin() + end);
        auto part = embed_batch(batch);
        for (auto& v : part) out.push_back(std::move(v));
        spdlog::debug("ollama {}: encoded {}/{}", model_, end, texts.size());
    }
    return out;
}

// ---- registry ----

std::shared_ptr<const Embedder> make_embedder(const std::string& model_identifier,
                                              const EmbedConfig& cfg,
                                              std::size_t expected_dim) {
    const std::string hashing = HashingEmbedder::kPrefix;
    const std::string ollama = OllamaEmbedder::kPrefix;

    if (model_identifier.compare(0, hashing.size(), hashing) == 0) {
        std::string digits = model_identifier.substr(hashing.size());
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw ConfigError("bad hashing model identifier: " + model_identifier);
        }
        std::size_t dim = 0;
        try {
            dim = std::stoul(digits);
        } catch (const std::out_of_range&) {
            throw ConfigError("hashing dimension out of range: " + model_identifier);
        }
        if (expected_dim != 0 && dim != expected_dim) {
            throw ConfigError("model " + model_identifier + " produces width " + std::to_string(dim) +
                              ", config says " + std::to_string(expected_dim));
        }
        return std::make_shared<HashingEmbedder>(dim);
    }
    if (model_identifier.compare(0, ollama.size(), ollama) == 0) {
        return std::make_shared<OllamaEmbedder>(model_identifier.substr(ollama.size()), cfg.ollama_url,
                                                cfg.timeout_ms, expected_dim);
    }
    throw ConfigError("unknown embedding model identifier: '" + model_identifier + "'");
}
