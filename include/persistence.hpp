#pragma once
#include "embedder.hpp"
#include "metadata_store.hpp"
#include "vector_index.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

struct IndexConfig {
    std::string model_name;
    std::size_t dimension{0};
    std::size_t vector_count{0};
};

struct BundlePaths {
    std::filesystem::path index;
    std::filesystem::path metadata;
    std::filesystem::path config;

    static BundlePaths in(const std::filesystem::path& dir);
};

struct LoadedArtifacts {
    IndexConfig config;
    std::unique_ptr<VectorIndex> index;
    MetadataStore metadata;
    std::shared_ptr<const Embedder> embedder;
};

using EmbedderFactory = std::function<std::shared_ptr<const Embedder>(const std::string& model, std::size_t dim)>;

// Reads and writes {index, metadata, config} as one bundle directory.
// Write order is index, metadata, config; config doubles as the "bundle
// complete" marker, so it is removed first and written last.
class PersistenceCodec {
public:
    static constexpr uint32_t kFormatVersion = 1;

    explicit PersistenceCodec(EmbedderFactory factory, BackendPreference backend = BackendPreference::Auto);

    // config.vector_count is ignored and replaced by index.vector_count().
    void save(const VectorIndex& index, const MetadataStore& metadata, const IndexConfig& config,
              const std::filesystem::path& dir) const;

    // Throws ConfigError / CorruptionError / EmbeddingError; never returns a partial bundle.
    LoadedArtifacts load(const std::filesystem::path& dir) const;

    // Exposed for tests of the on-disk format.
    static std::string encode_index(const VectorIndex& index);
    static std::string encode_metadata(const MetadataStore& metadata);
    // The header must declare expected_dim; checked before anything is allocated.
    std::unique_ptr<VectorIndex> decode_index(const std::string& bytes, std::size_t expected_dim) const;
    static MetadataStore decode_metadata(const std::string& bytes);

private:
    EmbedderFactory factory_;
    BackendPreference backend_;
};

// Codec whose embedders come from make_embedder() with the given settings.
PersistenceCodec make_codec(const EmbedConfig& embed, BackendPreference backend = BackendPreference::Auto);
