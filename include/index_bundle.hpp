#pragma once
#include "persistence.hpp"
#include "record.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Validated {index, metadata, config} plus the embedder that produced the
// vectors. Immutable once constructed, so any number of threads may search it.
class IndexBundle {
public:
    // Throws CorruptionError unless index size, record count and config agree.
    IndexBundle(IndexConfig config, std::unique_ptr<VectorIndex> index, MetadataStore metadata,
                std::shared_ptr<const Embedder> embedder);
    explicit IndexBundle(LoadedArtifacts artifacts);

    // Throws EmptyQueryError for blank text, EmbeddingError from the model.
    std::vector<SearchHit> search(const std::string& query, std::size_t k) const;

    void save(const PersistenceCodec& codec, const std::filesystem::path& dir) const;

    const IndexConfig& config() const { return config_; }
    const VectorIndex& index() const { return *index_; }
    const MetadataStore& metadata() const { return metadata_; }
    const Embedder& embedder() const { return *embedder_; }

private:
    IndexConfig config_;
    std::unique_ptr<VectorIndex> index_;
    MetadataStore metadata_;
    std::shared_ptr<const Embedder> embedder_;
};

// Batch ingest: the only place records and vectors are created.
std::shared_ptr<const IndexBundle> build_bundle(const std::vector<Record>& records,
                                                std::shared_ptr<const Embedder> embedder,
                                                std::size_t batch_size = 32,
                                                BackendPreference backend = BackendPreference::Auto);

// The serving reference to the active bundle. Reloads are built off to the
// side and swapped in one step; searches keep the snapshot they started with.
class IndexHandle {
public:
    explicit IndexHandle(PersistenceCodec codec);

    // Throws NotLoadedError when nothing has been published.
    std::shared_ptr<const IndexBundle> snapshot() const;
    bool loaded() const;

    void publish(std::shared_ptr<const IndexBundle> bundle);

    // Propagates load errors; the previously published bundle (if any) stays active.
    void load(const std::filesystem::path& dir);
    // Same, but logs the failure and returns false.
    bool try_load(const std::filesystem::path& dir);

    const PersistenceCodec& codec() const { return codec_; }

private:
    PersistenceCodec codec_;
    mutable std::mutex mtx_;
    std::shared_ptr<const IndexBundle> bundle_;
};
