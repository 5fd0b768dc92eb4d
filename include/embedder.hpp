#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <cstdint>

struct EmbedConfig {
    std::string model{"hashing-bow-384"};
    std::string ollama_url{"http://localhost:11434"};
    int timeout_ms{120000};
    int batch_size{32};
};

// text -> fixed-width vector. Implementations must be deterministic for a given
// model and safe to call from several threads at once.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::string model_name() const = 0;
    // 0 while the width is not yet known (remote model before its first reply).
    virtual std::size_t dimension() const = 0;

    // One vector per input, in input order. batch_size only changes how work is
    // chunked. Throws EmbeddingError; never returns a partial result.
    virtual std::vector<std::vector<float>> encode(const std::vector<std::string>& texts,
                                                   std::size_t batch_size = 32) const = 0;

    std::vector<float> encode_one(const std::string& text) const;
};

// Feature-hashing bag of words, model id "hashing-bow-<dim>".
// Lowercased ASCII alphanumeric tokens, FNV-1a into dim buckets, L2-normalized.
class HashingEmbedder : public Embedder {
public:
    static constexpr const char* kPrefix = "hashing-bow-";

    explicit HashingEmbedder(std::size_t dim = 384);

    std::string model_name() const override;
    std::size_t dimension() const override { return dim_; }
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts,
                                           std::size_t batch_size = 32) const override;

private:
    std::vector<float> embed(const std::string& text) const;

    std::size_t dim_;
};

// Remote embedding model served by Ollama, model id "ollama:<model>".
class OllamaEmbedder : public Embedder {
public:
    static constexpr const char* kPrefix = "ollama:";

    // expected_dim 0 means "learn it from the first reply".
    OllamaEmbedder(std::string model, std::string base_url, int timeout_ms, std::size_t expected_dim = 0);
    ~OllamaEmbedder() override;

    std::string model_name() const override;
    std::size_t dimension() const override;
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts,
                                           std::size_t batch_size = 32) const override;

    // Decodes one /api/embed reply and enforces the width; the first reply
    // fixes it when none was configured.
    std::vector<std::vector<float>> decode_reply(long status, const std::string& body,
                                                 std::size_t expected_count) const;

private:
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& batch) const;
    void check_width(std::size_t width) const;

    std::string model_;
    std::string base_;
    int timeout_ms_;
    struct State;
    std::unique_ptr<State> state_;
};

uint64_t fnv1a64(const std::string& s);

// {"embeddings": [[...], ...]} -> vectors. Throws EmbeddingError on a non-2xx
// status, a malformed body or a count other than expected_count.
std::vector<std::vector<float>> parse_ollama_embeddings(long status, const std::string& body,
                                                        std::size_t expected_count);

// Instantiates the embedder named by a model identifier. expected_dim, when
// non-zero, must match the model's width or ConfigError is thrown.
std::shared_ptr<const Embedder> make_embedder(const std::string& model_identifier,
                                              const EmbedConfig& cfg,
                                              std::size_t expected_dim = 0);
