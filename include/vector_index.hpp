#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstddef>

struct Neighbor {
    std::size_t position{0};
    float distance{0.0f};   // squared L2
};

// Maps squared L2 distance [0, inf) onto a similarity score (0, 1].
float distance_to_score(float distance);

// Flat (exhaustive) squared-L2 storage. Vectors are row-major and contiguous;
// squared norms are cached so that d(q, x) = |q|^2 + |x|^2 - 2 q.x, which keeps
// exact ties exact regardless of where the non-zero components sit.
class IndexBackend {
public:
    explicit IndexBackend(std::size_t dim);
    virtual ~IndexBackend() = default;

    virtual std::string name() const = 0;

    void add(const std::vector<std::vector<float>>& vectors);
    // Row-major block of rows.size() / dimension() vectors.
    void add_rows(const std::vector<float>& rows);
    // min(k, size()) nearest, ascending by (distance, position).
    std::vector<Neighbor> search(const std::vector<float>& query, std::size_t k) const;

    std::size_t size() const { return norms_.size(); }
    std::size_t dimension() const { return dim_; }
    const std::vector<float>& vector_data() const { return data_; }

protected:
    virtual float dot(const float* a, const float* b, std::size_t n) const = 0;

private:
    std::size_t dim_;
    std::vector<float> data_;
    std::vector<float> norms_;
};

class ScalarFlatL2Backend : public IndexBackend {
public:
    using IndexBackend::IndexBackend;
    std::string name() const override { return "flat-l2-scalar"; }

protected:
    float dot(const float* a, const float* b, std::size_t n) const override;
};

// AVX2/FMA kernel; only constructible on x86-64 CPUs reporting both features.
class Avx2FlatL2Backend : public IndexBackend {
public:
    explicit Avx2FlatL2Backend(std::size_t dim);
    std::string name() const override { return "flat-l2-avx2"; }

    static bool supported();

protected:
    float dot(const float* a, const float* b, std::size_t n) const override;
};

enum class BackendPreference {
    Auto,
    Scalar,
    Avx2,
};

BackendPreference backend_preference_from_string(const std::string& name);
std::string to_string(BackendPreference pref);

std::unique_ptr<IndexBackend> make_index_backend(BackendPreference pref, std::size_t dim);

// Exact nearest-neighbour index over one backend chosen at construction.
// Not synchronized: add() must not overlap with search() or another add().
class VectorIndex {
public:
    VectorIndex(std::size_t dim, BackendPreference pref = BackendPreference::Auto);

    void add(const std::vector<std::vector<float>>& vectors);
    void add_rows(const std::vector<float>& rows);
    std::vector<Neighbor> search(const std::vector<float>& query, std::size_t k) const;

    std::size_t vector_count() const { return backend_->size(); }
    std::size_t dimension() const { return backend_->dimension(); }
    std::string backend_name() const { return backend_->name(); }
    const std::vector<float>& vector_data() const { return backend_->vector_data(); }

private:
    std::unique_ptr<IndexBackend> backend_;
};
