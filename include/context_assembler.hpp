#pragma once
#include "index_bundle.hpp"
#include "record.hpp"
#include <optional>
#include <string>
#include <vector>

// Turns search hits into the grounding block placed in a generation prompt.
class ContextAssembler {
public:
    static constexpr const char* kNoContext = "No specific information found in the knowledge base for this query.";
    static constexpr const char* kNoKnowledgeApology =
        "I apologize, but I don't have specific information about your query in my knowledge base. "
        "Please try rephrasing your question.";
    static constexpr const char* kUnableApology =
        "I apologize, but I'm unable to generate a response at the moment. Please try again.";

    ContextAssembler(IndexHandle& handle, std::size_t top_k = 5, float similarity_threshold = 0.3f,
                     float direct_match_threshold = 0.85f);

    // Hits at or above the threshold, one block each in rank order. A response
    // already used by a higher-ranked hit is never repeated; a hit left with no
    // fresh response is skipped. Returns kNoContext when nothing survives.
    static std::string assemble(const std::vector<SearchHit>& hits, float similarity_threshold);

    // top_k search filtered at the similarity threshold.
    std::vector<SearchHit> retrieve(const std::string& query) const;
    std::string build_context(const std::string& query) const;

    // First response of the top hit when it clears the direct-match threshold.
    std::optional<std::string> direct_match(const std::string& query) const;

    // Reply to use when the generator is unavailable.
    static std::string fallback_response(const std::vector<SearchHit>& hits);

    // Replaces each "{context}" in tmpl.
    static std::string render_system_prompt(const std::string& tmpl, const std::string& context);

    std::size_t top_k() const { return top_k_; }
    float similarity_threshold() const { return similarity_threshold_; }
    float direct_match_threshold() const { return direct_match_threshold_; }

private:
    IndexHandle& handle_;
    std::size_t top_k_;
    float similarity_threshold_;
    float direct_match_threshold_;
};
