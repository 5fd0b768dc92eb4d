#include "../include/persistence.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <map>
#include <mutex>

using json = nlohmann::json;

namespace {
const char kIndexMagic[4] = {'R', 'V', 'I', 'X'};
const char kMetaMagic[4] = {'R', 'M', 'E', 'T'};

// Little-endian, fixed width, independent of host byte order.
struct ByteWriter {
    std::string out;

    void raw(const char* p, std::size_t n) { out.append(p, n); }
    void u8(uint8_t v) { out.push_back(static_cast<char>(v)); }
    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
    void u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
    void f32(float f) {
        uint32_t v;
        std::memcpy(&v, &f, sizeof(v));
        u32(v);
    }
    void str(const std::string& s) {
        if (s.size() > UINT32_MAX) throw std::length_error("string too long for metadata artifact");
        u32(static_cast<uint32_t>(s.size()));
        raw(s.data(), s.size());
    }
};

struct ByteReader {
    const std::string& in;
    const char* what;
    std::size_t pos{0};

    void need(std::size_t n) const {
        if (in.size() - pos < n) {
            throw CorruptionError(std::string(what) + " truncated at byte " + std::to_string(pos));
        }
    }
    void magic(const char (&m)[4]) {
        need(4);
        if (std::memcmp(in.data() + pos, m, 4) != 0) throw CorruptionError(std::string(what) + ": bad magic");
        pos += 4;
    }
    uint8_t u8() {
        need(1);
        return static_cast<uint8_t>(in[pos++]);
    }
    uint32_t u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(static_cast<unsigned char>(in[pos + i])) << (8 * i);
        pos += 4;
        return v;
    }
    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(static_cast<unsigned char>(in[pos + i])) << (8 * i);
        pos += 8;
        return v;
    }
    float f32() {
        uint32_t v = u32();
        float f;
        std::memcpy(&f, &v, sizeof(f));
        return f;
    }
    std::string str() {
        uint32_t n = u32();
        need(n);
        std::string s = in.substr(pos, n);
        pos += n;
        return s;
    }
    bool at_end() const { return pos == in.size(); }
};

std::mutex& save_lock_for(const std::filesystem::path& dir) {
    static std::mutex registry_mtx;
    static std::map<std::string, std::unique_ptr<std::mutex>> locks;
    std::lock_guard<std::mutex> lock(registry_mtx);
    auto& m = locks[std::filesystem::weakly_canonical(dir).string()];
    if (!m) m = std::make_unique<std::mutex>();
    return *m;
}

std::string read_artifact(const std::filesystem::path& p, const char* what) {
    if (!std::filesystem::exists(p)) throw CorruptionError(std::string(what) + " missing: " + p.string());
    try {
        return read_binary_file(p);
    } catch (const std::runtime_error& e) {
        throw CorruptionError(std::string(what) + " unreadable: " + e.what());
    }
}

void verify_digest(const json& cfg, const char* key, const std::string& bytes, const char* what) {
    if (!cfg.contains(key)) return;
    if (!cfg[key].is_string()) throw ConfigError(std::string("config field '") + key + "' must be a string");
    if (cfg[key].get<std::string>() != sha256_hex(bytes)) {
        throw CorruptionError(std::string(what) + " does not match the digest recorded in config.json");
    }
}
}

BundlePaths BundlePaths::in(const std::filesystem::path& dir) {
    return {dir / "vectors.index", dir / "metadata.bin", dir / "config.json"};
}

PersistenceCodec::PersistenceCodec(EmbedderFactory factory, BackendPreference backend)
    : factory_(std::move(factory)), backend_(backend) {}

std::string PersistenceCodec::encode_index(const VectorIndex& index) {
    ByteWriter w;
    w.raw(kIndexMagic, 4);
    w.u32(kFormatVersion);
    w.u32(static_cast<uint32_t>(index.dimension()));
    w.u64(index.vector_count());
    for (float f : index.vector_data()) w.f32(f);
    return std::move(w.out);
}

std::unique_ptr<VectorIndex> PersistenceCodec::decode_index(const std::string& bytes, std::size_t expected_dim) const {
    ByteReader r{bytes, "index artifact"};
    r.magic(kIndexMagic);
    uint32_t version = r.u32();
    if (version != kFormatVersion) throw CorruptionError("unsupported index format version " + std::to_string(version));
    uint32_t dim = r.u32();
    uint64_t count = r.u64();
    if (dim == 0) throw CorruptionError("index artifact has zero dimension");
    if (dim != expected_dim) {
        throw CorruptionError("index dimension " + std::to_string(dim) + " differs from config " +
                              std::to_string(expected_dim));
    }
    // count * dim * 4 bytes must remain; checked before allocating
    if (count > (bytes.size() - r.pos) / (4ull * dim)) {
        throw CorruptionError("index artifact holds fewer vectors than its header claims (" + std::to_string(count) + ")");
    }
    std::vector<float> rows(static_cast<std::size_t>(count) * dim);
    for (auto& f : rows) f = r.f32();
    if (!r.at_end()) throw CorruptionError("index artifact has trailing bytes");
    auto index = std::make_unique<VectorIndex>(dim, backend_);
    index->add_rows(rows);
    return index;
}

std::string PersistenceCodec::encode_metadata(const MetadataStore& metadata) {
    ByteWriter w;
    w.raw(kMetaMagic, 4);
    w.u32(kFormatVersion);
    w.u64(metadata.size());
    for (const auto& rec : metadata.records()) {
        w.str(rec.text);
        w.str(rec.tag);
        w.u32(static_cast<uint32_t>(rec.responses.size()));
        for (const auto& resp : rec.responses) w.str(resp);
        w.u8(static_cast<uint8_t>(rec.kind));
    }
    return std::move(w.out);
}

MetadataStore PersistenceCodec::decode_metadata(const std::string& bytes) {
    ByteReader r{bytes, "metadata artifact"};
    r.magic(kMetaMagic);
    uint32_t version = r.u32();
    if (version != kFormatVersion) throw CorruptionError("unsupported metadata format version " + std::to_string(version));
    uint64_t count = r.u64();
    std::vector<Record> records;
    for (uint64_t i = 0; i < count; ++i) {
        Record rec;
        rec.text = r.str();
        rec.tag = r.str();
        uint32_t n = r.u32();
        for (uint32_t j = 0; j < n; ++j) rec.responses.push_back(r.str());
        uint8_t kind = r.u8();
        if (kind != static_cast<uint8_t>(RecordKind::Pattern)) {
            throw CorruptionError("record " + std::to_string(i) + " has unknown kind " + std::to_string(kind));
        }
        rec.kind = static_cast<RecordKind>(kind);
        records.push_back(std::move(rec));
    }
    if (!r.at_end()) throw CorruptionError("metadata artifact has trailing bytes");
    try {
        return MetadataStore(std::move(records));
    } catch (const IngestError& e) {
        throw CorruptionError(std::string("metadata artifact holds an invalid record: ") + e.what());
    }
}

void PersistenceCodec::save(const VectorIndex& index, const MetadataStore& metadata, const IndexConfig& config,
                            const std::filesystem::path& dir) const {
    if (index.vector_count() != metadata.size()) {
        throw CorruptionError("refusing to save: " + std::to_string(index.vector_count()) + " vectors but " +
                              std::to_string(metadata.size()) + " records");
    }
    if (config.model_name.empty()) throw ConfigError("refusing to save: model_name is empty");
    if (config.dimension != index.dimension()) {
        throw ConfigError("refusing to save: config dimension " + std::to_string(config.dimension) +
                          " differs from index dimension " + std::to_string(index.dimension()));
    }

    std::filesystem::create_directories(dir);
    std::lock_guard<std::mutex> lock(save_lock_for(dir));
    auto paths = BundlePaths::in(dir);

    std::filesystem::remove(paths.config);

    std::string index_bytes = encode_index(index);
    write_file_atomic(paths.index, index_bytes);
    spdlog::info("saved index ({} vectors) to {}", index.vector_count(), paths.index.string());

    std::string meta_bytes = encode_metadata(metadata);
    write_file_atomic(paths.metadata, meta_bytes);
    spdlog::info("saved metadata ({} records) to {}", metadata.size(), paths.metadata.string());

    json cfg = {
        {"model_name", config.model_name},
        {"dimension", index.dimension()},
        {"total_vectors", index.vector_count()},
        {"format_version", kFormatVersion},
        {"index_sha256", sha256_hex(index_bytes)},
        {"metadata_sha256", sha256_hex(meta_bytes)}
    };
    write_file_atomic(paths.config, cfg.dump(2) + "\n");
    spdlog::info("saved configuration to {}", paths.config.string());
}

LoadedArtifacts PersistenceCodec::load(const std::filesystem::path& dir) const {
    auto paths = BundlePaths::in(dir);
    LoadedArtifacts out;

    // 1. config
    if (!std::filesystem::exists(paths.config)) {
        throw ConfigError("no complete bundle at " + dir.string() + " (config.json missing)");
    }
    json cfg;
    try {
        cfg = json::parse(read_text_file(paths.config));
    } catch (const json::exception& e) {
        throw ConfigError("config.json is not valid JSON: " + std::string(e.what()));
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    if (!cfg.is_object()) throw ConfigError("config.json must hold an object");
    if (!cfg.contains("model_name") || !cfg["model_name"].is_string() || cfg["model_name"].get<std::string>().empty()) {
        throw ConfigError("config.json: model_name must be a non-empty string");
    }
    if (!cfg.contains("dimension") || !cfg["dimension"].is_number_integer() || cfg["dimension"].get<long long>() <= 0) {
        throw ConfigError("config.json: dimension must be a positive integer");
    }
    if (!cfg.contains("total_vectors") || !cfg["total_vectors"].is_number_integer() ||
        cfg["total_vectors"].get<long long>() < 0) {
        throw ConfigError("config.json: total_vectors must be a non-negative integer");
    }
    if (cfg.contains("format_version") &&
        (!cfg["format_version"].is_number_integer() || cfg["format_version"].get<long long>() != static_cast<long long>(kFormatVersion))) {
        throw ConfigError("config.json: unsupported format_version");
    }
    out.config.model_name = cfg["model_name"].get<std::string>();
    out.config.dimension = cfg["dimension"].get<std::size_t>();
    out.config.vector_count = cfg["total_vectors"].get<std::size_t>();

    // 2. index
    std::string index_bytes = read_artifact(paths.index, "index artifact");
    verify_digest(cfg, "index_sha256", index_bytes, "index artifact");
    out.index = decode_index(index_bytes, out.config.dimension);
    if (out.index->vector_count() != out.config.vector_count) {
        throw CorruptionError("index holds " + std::to_string(out.index->vector_count()) +
                              " vectors, config says " + std::to_string(out.config.vector_count));
    }

    // 3. metadata
    std::string meta_bytes = read_artifact(paths.metadata, "metadata artifact");
    verify_digest(cfg, "metadata_sha256", meta_bytes, "metadata artifact");
    out.metadata = decode_metadata(meta_bytes);
    if (out.metadata.size() != out.index->vector_count()) {
        throw CorruptionError("metadata holds " + std::to_string(out.metadata.size()) + " records for " +
                              std::to_string(out.index->vector_count()) + " vectors");
    }

    // 4. the bundle's own model, whatever the caller is configured with
    out.embedder = factory_(out.config.model_name, out.config.dimension);
    if (!out.embedder) throw ConfigError("no embedder for model " + out.config.model_name);
    if (out.embedder->dimension() != 0 && out.embedder->dimension() != out.config.dimension) {
        throw ConfigError("model " + out.config.model_name + " produces width " +
                          std::to_string(out.embedder->dimension()) + ", bundle was built with " +
                          std::to_string(out.config.dimension));
    }

    spdlog::info("loaded bundle from {}: {} vectors, dim {}, model {}, backend {}", dir.string(),
                 out.index->vector_count(), out.config.dimension, out.config.model_name, out.index->backend_name());
    return out;
}

PersistenceCodec make_codec(const EmbedConfig& embed, BackendPreference backend) {
    return PersistenceCodec(
        [embed](const std::string& model, std::size_t dim) { return make_embedder(model, embed, dim); },
        backend);
}
