#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

namespace {
void check_unit(const char* name, float v) {
    if (!(v >= 0.0f && v <= 1.0f)) throw ConfigError(std::string(name) + " must be within [0, 1], got " + std::to_string(v));
}
}

RetrievalConfig load_config_from_env() {
    RetrievalConfig cfg;
    cfg.bundle_dir = getenv_or("RETRIEVAL_BUNDLE_DIR", cfg.bundle_dir.string());
    cfg.embed.model = getenv_or("RETRIEVAL_EMBED_MODEL", cfg.embed.model);
    cfg.embed.ollama_url = getenv_or("OLLAMA_URL", cfg.embed.ollama_url);
    cfg.embed.timeout_ms = getenv_int_or("RETRIEVAL_EMBED_TIMEOUT_MS", cfg.embed.timeout_ms);
    cfg.embed.batch_size = getenv_int_or("RETRIEVAL_BATCH_SIZE", cfg.embed.batch_size);
    cfg.backend = backend_preference_from_string(getenv_or("RETRIEVAL_INDEX_BACKEND", to_string(cfg.backend)));
    cfg.intent_threshold = (float)getenv_double_or("RETRIEVAL_INTENT_THRESHOLD", cfg.intent_threshold);
    cfg.context_threshold = (float)getenv_double_or("RETRIEVAL_CONTEXT_THRESHOLD", cfg.context_threshold);
    cfg.direct_match_threshold = (float)getenv_double_or("RETRIEVAL_DIRECT_MATCH_THRESHOLD", cfg.direct_match_threshold);
    cfg.context_top_k = getenv_int_or("RETRIEVAL_CONTEXT_TOP_K", cfg.context_top_k);
    cfg.log_level = getenv_or("RETRIEVAL_LOG_LEVEL", cfg.log_level);
    validate_config(cfg);
    return cfg;
}

void validate_config(const RetrievalConfig& cfg) {
    check_unit("intent_threshold", cfg.intent_threshold);
    check_unit("context_threshold", cfg.context_threshold);
    check_unit("direct_match_threshold", cfg.direct_match_threshold);
    if (cfg.context_top_k < 0) throw ConfigError("context_top_k must not be negative");
    if (cfg.embed.batch_size <= 0) throw ConfigError("batch_size must be positive");
    if (cfg.embed.timeout_ms <= 0) throw ConfigError("embed timeout must be positive");
    if (cfg.embed.model.empty()) throw ConfigError("embedding model identifier is empty");
}
