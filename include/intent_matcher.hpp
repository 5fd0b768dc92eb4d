#pragma once
#include "index_bundle.hpp"
#include "record.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

struct MatchResult {
    bool matched{false};
    std::optional<SearchHit> best;
    float threshold{0.0f};
};

struct MatcherStats {
    bool loaded{false};
    float threshold{0.0f};
    // set only when loaded
    std::optional<std::size_t> total_vectors;
    std::optional<std::size_t> dimension;
    std::optional<std::string> model_name;
    std::optional<std::size_t> metadata_count;
    std::optional<std::string> index_backend;
};

// Threshold-gated lookup of canned intent responses.
//
// Every query method throws NotLoadedError while the handle holds no bundle,
// so "no index" is never confused with "nothing relevant". Falling below the
// threshold is a normal outcome and yields an empty optional / matched=false.
class IntentMatcher {
public:
    static constexpr const char* kDefaultFallback = "I'm not sure how to help with that. Can you rephrase?";

    explicit IntentMatcher(IndexHandle& handle, float threshold = 0.5f,
                           std::string fallback = kDefaultFallback);

    bool loaded() const { return handle_.loaded(); }

    std::optional<SearchHit> match_intent(const std::string& query, std::size_t k = 5) const;
    // Per-call threshold overrides the configured one without changing it.
    MatchResult match(const std::string& query, std::size_t k = 1,
                      std::optional<float> threshold = std::nullopt) const;
    std::vector<SearchHit> search_intents(const std::string& query, std::size_t k = 10,
                                          std::optional<float> min_score = std::nullopt) const;

    std::string get_response(const std::string& query, bool randomize = true) const;
    std::optional<std::string> get_intent_tag(const std::string& query) const;

    MatcherStats stats() const;

    float threshold() const { return threshold_.load(); }
    void set_threshold(float t);
    const std::string& fallback() const { return fallback_; }

private:
    IndexHandle& handle_;
    std::atomic<float> threshold_;
    std::string fallback_;
};
