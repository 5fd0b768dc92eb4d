#include "../include/index_bundle.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>

IndexBundle::IndexBundle(IndexConfig config, std::unique_ptr<VectorIndex> index, MetadataStore metadata,
                         std::shared_ptr<const Embedder> embedder)
    : config_(std::move(config)), index_(std::move(index)), metadata_(std::move(metadata)), embedder_(std::move(embedder)) {
    if (!index_) throw CorruptionError("bundle has no index");
    if (!embedder_) throw ConfigError("bundle has no embedder");
    if (index_->vector_count() != metadata_.size()) {
        throw CorruptionError("bundle misaligned: " + std::to_string(index_->vector_count()) + " vectors, " +
                              std::to_string(metadata_.size()) + " records");
    }
    if (config_.vector_count != index_->vector_count()) {
        throw CorruptionError("bundle config counts " + std::to_string(config_.vector_count) + " vectors, index holds " +
                              std::to_string(index_->vector_count()));
    }
    if (config_.dimension != index_->dimension()) {
        throw ConfigError("bundle config dimension " + std::to_string(config_.dimension) + " differs from index " +
                          std::to_string(index_->dimension()));
    }
}

IndexBundle::IndexBundle(LoadedArtifacts artifacts)
    : IndexBundle(std::move(artifacts.config), std::move(artifacts.index), std::move(artifacts.metadata),
                  std::move(artifacts.embedder)) {}

std::vector<SearchHit> IndexBundle::search(const std::string& query, std::size_t k) const {
    if (is_blank(query)) throw EmptyQueryError();
    if (k == 0 || index_->vector_count() == 0) return {};

    auto qvec = embedder_->encode_one(query);
    auto neighbors = index_->search(qvec, k);

    std::vector<SearchHit> hits;
    hits.reserve(neighbors.size());
    int rank = 1;
    for (const auto& nb : neighbors) {
        SearchHit h;
        h.rank = rank++;
        h.record = metadata_.at(nb.position);
        h.distance = nb.distance;
        h.score = distance_to_score(nb.distance);
        hits.push_back(std::move(h));
    }
    spdlog::debug("search '{}' k={} -> {} hits", truncate_for_log(query), k, hits.size());
    return hits;
}

void IndexBundle::save(const PersistenceCodec& codec, const std::filesystem::path& dir) const {
    codec.save(*index_, metadata_, config_, dir);
}

std::shared_ptr<const IndexBundle> build_bundle(const std::vector<Record>& records,
                                                std::shared_ptr<const Embedder> embedder,
                                                std::size_t batch_size,
                                                BackendPreference backend) {
    if (!embedder) throw ConfigError("build needs an embedder");
    for (const auto& r : records) validate_record(r);

    std::vector<std::string> texts;
    texts.reserve(records.size());
    for (const auto& r : records) texts.push_back(r.text);

    spdlog::info("encoding {} texts with {} (batch size {})", texts.size(), embedder->model_name(), batch_size);
    auto vectors = embedder->encode(texts, batch_size);
    if (vectors.size() != texts.size()) {
        throw EmbeddingError("embedder returned " + std::to_string(vectors.size()) + " vectors for " +
                             std::to_string(texts.size()) + " texts");
    }

    std::size_t dim = vectors.empty() ? embedder->dimension() : vectors.front().size();
    if (dim == 0) throw ConfigError("cannot size an empty index: model " + embedder->model_name() + " has unknown width");

    auto index = std::make_unique<VectorIndex>(dim, backend);
    index->add(vectors);
    MetadataStore metadata;
    metadata.append(records);

    IndexConfig config{embedder->model_name(), dim, index->vector_count()};
    spdlog::info("built index: {} vectors, dim {}, backend {}", index->vector_count(), dim, index->backend_name());
    return std::make_shared<const IndexBundle>(std::move(config), std::move(index), std::move(metadata),
                                               std::move(embedder));
}

IndexHandle::IndexHandle(PersistenceCodec codec) : codec_(std::move(codec)) {}

std::shared_ptr<const IndexBundle> IndexHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!bundle_) throw NotLoadedError();
    return bundle_;
}

bool IndexHandle::loaded() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return bundle_ != nullptr;
}

void IndexHandle::publish(std::shared_ptr<const IndexBundle> bundle) {
    if (!bundle) throw std::invalid_argument("cannot publish an empty bundle");
    std::size_t count = bundle->index().vector_count();
    std::shared_ptr<const IndexBundle> old;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        old = std::move(bundle_);
        bundle_ = std::move(bundle);
    }
    // old bundle is released outside the lock, or later by the last search holding it
    spdlog::info("published index bundle ({} vectors)", count);
}

void IndexHandle::load(const std::filesystem::path& dir) {
    auto bundle = std::make_shared<const IndexBundle>(codec_.load(dir));
    publish(std::move(bundle));
}

bool IndexHandle::try_load(const std::filesystem::path& dir) {
    try {
        load(dir);
        return true;
    } catch (const RetrievalError& e) {
        spdlog::error("failed to load vector database from {}: {}", dir.string(), e.what());
        spdlog::error("run 'retrieval_cli build' to create the index");
        return false;
    }
}
