#include "../include/context_assembler.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>
#include <unordered_set>

ContextAssembler::ContextAssembler(IndexHandle& handle, std::size_t top_k, float similarity_threshold,
                                   float direct_match_threshold)
    : handle_(handle), top_k_(top_k), similarity_threshold_(similarity_threshold),
      direct_match_threshold_(direct_match_threshold) {
    if (!(similarity_threshold >= 0.0f && similarity_threshold <= 1.0f) ||
        !(direct_match_threshold >= 0.0f && direct_match_threshold <= 1.0f)) {
        throw std::invalid_argument("thresholds must be within [0, 1]");
    }
}

std::string ContextAssembler::assemble(const std::vector<SearchHit>& hits, float similarity_threshold) {
    std::string out;
    std::unordered_set<std::string> seen;
    for (const auto& h : hits) {
        if (h.score < similarity_threshold) continue;

        std::vector<const std::string*> fresh;
        for (const auto& r : h.record.responses) {
            if (!seen.count(r)) fresh.push_back(&r);
        }
        if (fresh.empty()) continue;

        char relevance[32];
        std::snprintf(relevance, sizeof(relevance), "%.2f", h.score);
        if (!out.empty()) out += "\n\n";
        out += "[Context " + std::to_string(h.rank) + "] (Relevance: " + relevance + ")\n";
        out += "Topic: " + h.record.tag + "\n";
        if (!h.record.text.empty()) out += "Related Query: " + h.record.text + "\n";
        out += "Information: " + *fresh.front();
        // all of this hit's responses count as used, not only the one shown
        for (const auto* r : fresh) seen.insert(*r);
    }
    return out.empty() ? kNoContext : out;
}

std::vector<SearchHit> ContextAssembler::retrieve(const std::string& query) const {
    auto hits = handle_.snapshot()->search(query, top_k_);
    std::vector<SearchHit> kept;
    for (auto& h : hits) {
        if (h.score >= similarity_threshold_) kept.push_back(std::move(h));
    }
    spdlog::info("retrieved {} relevant contexts for query: {}", kept.size(), truncate_for_log(query));
    return kept;
}

std::string ContextAssembler::build_context(const std::string& query) const {
    return assemble(retrieve(query), similarity_threshold_);
}

std::optional<std::string> ContextAssembler::direct_match(const std::string& query) const {
    auto hits = handle_.snapshot()->search(query, 1);
    if (hits.empty() || hits.front().score < direct_match_threshold_) return std::nullopt;
    const auto& responses = hits.front().record.responses;
    if (responses.empty()) return std::nullopt;
    spdlog::info("direct match found for query: {}", truncate_for_log(query));
    return responses.front();
}

std::string ContextAssembler::fallback_response(const std::vector<SearchHit>& hits) {
    if (hits.empty()) return kNoKnowledgeApology;
    const auto& responses = hits.front().record.responses;
    if (!responses.empty()) return responses.front();
    return kUnableApology;
}

std::string ContextAssembler::render_system_prompt(const std::string& tmpl, const std::string& context) {
    static const std::string placeholder = "{context}";
    std::string out;
    std::size_t pos = 0;
    while (true) {
        auto next = tmpl.find(placeholder, pos);
        if (next == std::string::npos) break;
        out.append(tmpl, pos, next - pos);
        out += context;
        pos = next + placeholder.size();
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}
