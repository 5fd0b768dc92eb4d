#include <gtest/gtest.h>
#include "../include/config.hpp"
#include "../include/context_assembler.hpp"
#include "../include/errors.hpp"
#include "test_util.hpp"

namespace {

SearchHit make_hit(int rank, const std::string& tag, const std::string& text, std::vector<std::string> responses,
                   float score) {
    SearchHit h;
    h.rank = rank;
    h.record = Record{text, tag, std::move(responses), RecordKind::Pattern};
    h.score = score;
    h.distance = 1.0f / score - 1.0f;
    return h;
}

std::size_t count_of(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

}  // namespace

TEST(ContextAssemblerTest, NothingRelevantYieldsSentinel) {
    EXPECT_EQ(ContextAssembler::assemble({}, 0.3f), ContextAssembler::kNoContext);
    std::vector<SearchHit> weak = {make_hit(1, "hours_info", "opening hours", {"We are open 9-5."}, 0.2f)};
    EXPECT_EQ(ContextAssembler::assemble(weak, 0.3f), ContextAssembler::kNoContext);
}

TEST(ContextAssemblerTest, BlockFormat) {
    std::vector<SearchHit> hits = {
        make_hit(1, "hours_info", "opening hours", {"We are open 9-5."}, 0.92f),
        make_hit(2, "location_info", "where is it", {"Main campus."}, 0.456f),
    };
    EXPECT_EQ(ContextAssembler::assemble(hits, 0.3f),
              "[Context 1] (Relevance: 0.92)\n"
              "Topic: hours_info\n"
              "Related Query: opening hours\n"
              "Information: We are open 9-5.\n"
              "\n"
              "[Context 2] (Relevance: 0.46)\n"
              "Topic: location_info\n"
              "Related Query: where is it\n"
              "Information: Main campus.");
}

TEST(ContextAssemblerTest, ResponsesAreNeverRepeated) {
    std::vector<SearchHit> hits = {
        make_hit(1, "greeting", "hi there", {"Hello!", "Hi!"}, 0.9f),
        make_hit(2, "greeting", "hello", {"Hi!"}, 0.8f),
        make_hit(3, "greeting", "hey", {"Hi!", "Hey you."}, 0.7f),
    };
    auto ctx = ContextAssembler::assemble(hits, 0.3f);
    EXPECT_EQ(count_of(ctx, "Hi!"), 0u);
    EXPECT_EQ(count_of(ctx, "Information: Hello!"), 1u);
    EXPECT_EQ(count_of(ctx, "Information: Hey you."), 1u);
    EXPECT_EQ(ctx.find("[Context 2]"), std::string::npos);
    EXPECT_LT(ctx.find("[Context 1]"), ctx.find("[Context 3]"));
}

TEST(ContextAssemblerTest, HitsWithoutResponsesAreSkipped) {
    std::vector<SearchHit> hits = {
        make_hit(1, "a", "x", {}, 0.9f),
        make_hit(2, "b", "y", {}, 0.8f),
    };
    EXPECT_EQ(ContextAssembler::assemble(hits, 0.3f), ContextAssembler::kNoContext);
}

TEST(ContextAssemblerTest, AssembleIsDeterministic) {
    std::vector<SearchHit> hits = {
        make_hit(1, "hours_info", "opening hours", {"We are open 9-5."}, 0.92f),
        make_hit(2, "greeting", "hello", {"Hello!", "Hi!"}, 0.5f),
    };
    EXPECT_EQ(ContextAssembler::assemble(hits, 0.3f), ContextAssembler::assemble(hits, 0.3f));
}

TEST(ContextAssemblerTest, FallbackResponse) {
    EXPECT_EQ(ContextAssembler::fallback_response({}), ContextAssembler::kNoKnowledgeApology);
    std::vector<SearchHit> hits = {make_hit(1, "hours_info", "opening hours", {"We are open 9-5.", "Later."}, 0.9f)};
    EXPECT_EQ(ContextAssembler::fallback_response(hits), "We are open 9-5.");
    std::vector<SearchHit> bare = {make_hit(1, "x", "y", {}, 0.9f)};
    EXPECT_EQ(ContextAssembler::fallback_response(bare), ContextAssembler::kUnableApology);
}

TEST(ContextAssemblerTest, RenderSystemPrompt) {
    EXPECT_EQ(ContextAssembler::render_system_prompt("Use this:\n{context}\nEnd. {context}", "CTX"),
              "Use this:\nCTX\nEnd. CTX");
    EXPECT_EQ(ContextAssembler::render_system_prompt("no placeholder", "CTX"), "no placeholder");
    EXPECT_EQ(ContextAssembler::render_system_prompt("{context}", "{context}"), "{context}");
}

TEST(ContextAssemblerTest, InvalidThresholdsRejected) {
    IndexHandle handle(test_codec());
    EXPECT_THROW(ContextAssembler(handle, 5, 1.2f, 0.85f), std::invalid_argument);
    EXPECT_THROW(ContextAssembler(handle, 5, 0.3f, -0.5f), std::invalid_argument);
}

TEST(ContextAssemblerTest, UnloadedHandleRaises) {
    IndexHandle handle(test_codec());
    ContextAssembler assembler(handle);
    EXPECT_THROW(assembler.build_context("hello"), NotLoadedError);
    EXPECT_THROW(assembler.direct_match("hello"), NotLoadedError);
}

TEST(ContextAssemblerTest, BuildsContextFromLiveIndex) {
    IndexHandle handle(test_codec());
    handle.publish(build_test_bundle(campus_records()));

    ContextAssembler strict(handle, 5, 0.5f, 0.85f);
    EXPECT_EQ(strict.build_context("what are your opening hours"),
              "[Context 1] (Relevance: 1.00)\n"
              "Topic: hours_info\n"
              "Related Query: what are your opening hours\n"
              "Information: We are open 9-5.");
    EXPECT_EQ(strict.retrieve("when are the opening hours today").size(), 1u);
    EXPECT_EQ(strict.build_context("completely unrelated words"), ContextAssembler::kNoContext);

    ContextAssembler loose(handle, 5, 0.35f, 0.85f);
    auto hits = loose.retrieve("when are the opening hours today");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].record.tag, "hours_info");
    EXPECT_EQ(hits[1].record.tag, "location_info");
}

TEST(ContextAssemblerTest, GreetingResponsesAppearOnce) {
    IndexHandle handle(test_codec());
    handle.publish(build_test_bundle(campus_records()));
    ContextAssembler assembler(handle, 5, 0.3f, 0.85f);

    auto ctx = assembler.build_context("hi");
    EXPECT_EQ(count_of(ctx, "Hello! How can I help?"), 1u);
    EXPECT_EQ(count_of(ctx, "Hi! What can I do for you?"), 0u);
    EXPECT_EQ(count_of(ctx, "Topic: greeting"), 1u);
    EXPECT_EQ(ctx.rfind("[Context 1] (Relevance: 0.63)\nTopic: greeting\nRelated Query: hi there\n", 0), 0u);
}

TEST(ContextAssemblerTest, DirectMatch) {
    IndexHandle handle(test_codec());
    handle.publish(build_test_bundle(campus_records()));
    ContextAssembler assembler(handle);

    EXPECT_EQ(assembler.direct_match("what are your opening hours").value_or(""), "We are open 9-5.");
    EXPECT_FALSE(assembler.direct_match("opening hours").has_value());
    EXPECT_THROW(assembler.direct_match(""), EmptyQueryError);
}

TEST(ContextAssemblerTest, DefaultSystemPromptWrapsContext) {
    IndexHandle handle(test_codec());
    handle.publish(build_test_bundle(campus_records()));
    RetrievalConfig cfg;
    ContextAssembler assembler(handle, (std::size_t)cfg.context_top_k, 0.5f, cfg.direct_match_threshold);

    std::string context = assembler.build_context("what are your opening hours");
    auto prompt = ContextAssembler::render_system_prompt(cfg.system_prompt_template, context);
    EXPECT_EQ(prompt.find("{context}"), std::string::npos);
    EXPECT_NE(prompt.find("Context Information:\n" + context + "\n"), std::string::npos);
    EXPECT_EQ(prompt.rfind("You are a professional", 0), 0u);
}
