#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
#include <immintrin.h>
#define RETRIEVAL_HAVE_AVX2_KERNEL 1
#endif

float distance_to_score(float distance) {
    if (!(distance >= 0.0f)) distance = 0.0f;  // also catches NaN
    float score = 1.0f / (1.0f + distance);
    return std::max(score, std::numeric_limits<float>::min());
}

IndexBackend::IndexBackend(std::size_t dim) : dim_(dim) {
    if (dim_ == 0) throw std::invalid_argument("index dimension must be positive");
}

void IndexBackend::add(const std::vector<std::vector<float>>& vectors) {
    for (std::size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim_) {
            throw std::invalid_argument("vector " + std::to_string(i) + " has width " +
                                        std::to_string(vectors[i].size()) + ", index expects " + std::to_string(dim_));
        }
    }
    data_.reserve(data_.size() + vectors.size() * dim_);
    norms_.reserve(norms_.size() + vectors.size());
    for (const auto& v : vectors) {
        data_.insert(data_.end(), v.begin(), v.end());
        norms_.push_back(dot(v.data(), v.data(), dim_));
    }
}

void IndexBackend::add_rows(const std::vector<float>& rows) {
    if (rows.size() % dim_ != 0) {
        throw std::invalid_argument("row block of " + std::to_string(rows.size()) + " floats is not a multiple of " +
                                    std::to_string(dim_));
    }
    const std::size_t n = rows.size() / dim_;
    std::size_t first = size();
    data_.insert(data_.end(), rows.begin(), rows.end());
    norms_.reserve(norms_.size() + n);
    for (std::size_t i = 0; i < n; ++i) {
        const float* v = data_.data() + (first + i) * dim_;
        norms_.push_back(dot(v, v, dim_));
    }
}

std::vector<Neighbor> IndexBackend::search(const std::vector<float>& query, std::size_t k) const {
    if (query.size() != dim_) {
        throw std::invalid_argument("query has width " + std::to_string(query.size()) + ", index expects " +
                                    std::to_string(dim_));
    }
    const std::size_t n = size();
    k = std::min(k, n);
    if (k == 0) return {};

    const float qn = dot(query.data(), query.data(), dim_);
    std::vector<Neighbor> all(n);
    for (std::size_t i = 0; i < n; ++i) {
        float d = qn + norms_[i] - 2.0f * dot(query.data(), data_.data() + i * dim_, dim_);
        all[i] = {i, std::max(0.0f, d)};
    }
    auto closer = [](const Neighbor& a, const Neighbor& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.position < b.position;
    };
    std::partial_sort(all.begin(), all.begin() + k, all.end(), closer);
    all.resize(k);
    return all;
}

float ScalarFlatL2Backend::dot(const float* a, const float* b, std::size_t n) const {
    float sum = 0.0f;
    for (std::size_t i = 0; i < n; ++i) sum += a[i] * b[i];
    return sum;
}

#ifdef RETRIEVAL_HAVE_AVX2_KERNEL
__attribute__((target("avx2,fma")))
static float dot_avx2(const float* a, const float* b, std::size_t n) {
    __m256 acc = _mm256_setzero_ps();
    std::size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        acc = _mm256_fmadd_ps(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i), acc);
    }
    alignas(32) float lanes[8];
    _mm256_store_ps(lanes, acc);
    float sum = ((lanes[0] + lanes[1]) + (lanes[2] + lanes[3])) + ((lanes[4] + lanes[5]) + (lanes[6] + lanes[7]));
    for (; i < n; ++i) sum += a[i] * b[i];
    return sum;
}
#endif

Avx2FlatL2Backend::Avx2FlatL2Backend(std::size_t dim) : IndexBackend(dim) {
    if (!supported()) throw ConfigError("AVX2 index backend requested but the CPU does not support AVX2/FMA");
}

bool Avx2FlatL2Backend::supported() {
#ifdef RETRIEVAL_HAVE_AVX2_KERNEL
    return __builtin_cpu_supports("avx2") && __builtin_cpu_supports("fma");
#else
    return false;
#endif
}

float Avx2FlatL2Backend::dot(const float* a, const float* b, std::size_t n) const {
#ifdef RETRIEVAL_HAVE_AVX2_KERNEL
    return dot_avx2(a, b, n);
#else
    (void)a; (void)b; (void)n;
    throw ConfigError("AVX2 kernel not compiled in");
#endif
}

BackendPreference backend_preference_from_string(const std::string& name) {
    if (name == "auto") return BackendPreference::Auto;
    if (name == "scalar") return BackendPreference::Scalar;
    if (name == "avx2") return BackendPreference::Avx2;
    throw ConfigError("unknown index backend '" + name + "' (expected auto, scalar or avx2)");
}

std::string to_string(BackendPreference pref) {
    switch (pref) {
        case BackendPreference::Auto: return "auto";
        case BackendPreference::Scalar: return "scalar";
        case BackendPreference::Avx2: return "avx2";
    }
    return "auto";
}

std::unique_ptr<IndexBackend> make_index_backend(BackendPreference pref, std::size_t dim) {
    switch (pref) {
        case BackendPreference::Scalar:
            return std::make_unique<ScalarFlatL2Backend>(dim);
        case BackendPreference::Avx2:
            return std::make_unique<Avx2FlatL2Backend>(dim);
        case BackendPreference::Auto:
            break;
    }
    if (Avx2FlatL2Backend::supported()) return std::make_unique<Avx2FlatL2Backend>(dim);
    return std::make_unique<ScalarFlatL2Backend>(dim);
}

VectorIndex::VectorIndex(std::size_t dim, BackendPreference pref)
    : backend_(make_index_backend(pref, dim)) {
    spdlog::debug("vector index: dim={} backend={}", dim, backend_->name());
}

void VectorIndex::add(const std::vector<std::vector<float>>& vectors) {
    backend_->add(vectors);
}

void VectorIndex::add_rows(const std::vector<float>& rows) {
    backend_->add_rows(rows);
}

std::vector<Neighbor> VectorIndex::search(const std::vector<float>& query, std::size_t k) const {
    return backend_->search(query, k);
}
