#include "../include/intent_matcher.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <random>
#include <stdexcept>

namespace {
void check_threshold(float t) {
    if (!(t >= 0.0f && t <= 1.0f)) throw std::invalid_argument("threshold must be within [0, 1]");
}
}

IntentMatcher::IntentMatcher(IndexHandle& handle, float threshold, std::string fallback)
    : handle_(handle), threshold_(threshold), fallback_(std::move(fallback)) {
    check_threshold(threshold);
}

void IntentMatcher::set_threshold(float t) {
    check_threshold(t);
    threshold_.store(t);
}

MatchResult IntentMatcher::match(const std::string& query, std::size_t k, std::optional<float> threshold) const {
    MatchResult res;
    res.threshold = threshold ? *threshold : threshold_.load();
    check_threshold(res.threshold);

    auto hits = handle_.snapshot()->search(query, k);
    if (!hits.empty() && hits.front().score >= res.threshold) {
        res.matched = true;
        res.best = std::move(hits.front());
        spdlog::debug("intent '{}' -> {} ({:.3f})", truncate_for_log(query), res.best->record.tag, res.best->score);
    } else {
        spdlog::debug("intent '{}' -> no match above {}", truncate_for_log(query), res.threshold);
    }
    return res;
}

std::optional<SearchHit> IntentMatcher::match_intent(const std::string& query, std::size_t k) const {
    return match(query, k).best;
}

std::vector<SearchHit> IntentMatcher::search_intents(const std::string& query, std::size_t k,
                                                     std::optional<float> min_score) const {
    auto hits = handle_.snapshot()->search(query, k);
    if (!min_score) return hits;
    std::vector<SearchHit> kept;
    for (auto& h : hits) {
        if (h.score >= *min_score) kept.push_back(std::move(h));
    }
    return kept;
}

std::string IntentMatcher::get_response(const std::string& query, bool randomize) const {
    auto hit = match_intent(query);
    if (!hit || hit->record.responses.empty()) return fallback_;

    const auto& responses = hit->record.responses;
    if (randomize && responses.size() > 1) {
        thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<std::size_t> pick(0, responses.size() - 1);
        return responses[pick(rng)];
    }
    return responses.front();
}

std::optional<std::string> IntentMatcher::get_intent_tag(const std::string& query) const {
    auto hit = match_intent(query);
    if (!hit) return std::nullopt;
    return hit->record.tag;
}

MatcherStats IntentMatcher::stats() const {
    MatcherStats s;
    s.threshold = threshold_.load();
    if (!handle_.loaded()) return s;
    auto bundle = handle_.snapshot();  // a published bundle is never withdrawn
    s.loaded = true;
    s.total_vectors = bundle->index().vector_count();
    s.dimension = bundle->config().dimension;
    s.model_name = bundle->config().model_name;
    s.metadata_count = bundle->metadata().size();
    s.index_backend = bundle->index().backend_name();
    return s;
}
