#pragma once
#include "embedder.hpp"
#include "vector_index.hpp"
#include <filesystem>
#include <string>

// Process-level settings. The three thresholds are independent knobs; a higher
// value only means stricter precision for that call site.
struct RetrievalConfig {
    std::filesystem::path bundle_dir{"data/vector_db"};
    EmbedConfig embed;
    BackendPreference backend{BackendPreference::Auto};
    float intent_threshold{0.5f};
    float context_threshold{0.3f};
    float direct_match_threshold{0.85f};
    int context_top_k{5};
    std::string log_level{"info"};
    std::string fallback_response{"I'm not sure how to help with that. Can you rephrase?"};
    std::string system_prompt_template{
        "You are a professional and knowledgeable virtual assistant.\n"
        "Use the provided context information to answer accurately. If the context does not "
        "contain relevant information, say so honestly.\n\n"
        "Context Information:\n{context}\n\n"
        "Based on the above context, please provide an accurate response to the user's query."};
};

// Defaults overridden by RETRIEVAL_* / OLLAMA_URL environment variables.
// Throws ConfigError on malformed values.
RetrievalConfig load_config_from_env();
void validate_config(const RetrievalConfig& cfg);
