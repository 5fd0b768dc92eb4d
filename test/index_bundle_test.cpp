#include <gtest/gtest.h>
#include "../include/errors.hpp"
#include "../include/index_bundle.hpp"
#include "test_util.hpp"
#include <atomic>
#include <thread>

TEST(IndexBundleTest, BlankQueryRejectedBeforeEmbedding) {
    auto bundle = build_test_bundle(hours_location_records());
    EXPECT_THROW(bundle->search("", 1), EmptyQueryError);
    EXPECT_THROW(bundle->search("  \t\n", 1), EmptyQueryError);
}

TEST(IndexBundleTest, HitsCarryCopiesOfRecords) {
    auto bundle = build_test_bundle(hours_location_records());
    auto hits = bundle->search("hours", 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].rank, 1);
    EXPECT_EQ(hits[0].score, 1.0f);
    hits[0].record.responses.push_back("tampered");
    hits[0].record.tag = "changed";

    auto again = bundle->search("hours", 1);
    EXPECT_EQ(again[0].record.tag, "hours_info");
    EXPECT_EQ(again[0].record.responses.size(), 1u);
}

TEST(IndexBundleTest, RanksAreOneBasedAndScoresDescend) {
    auto bundle = build_test_bundle(campus_records());
    auto hits = bundle->search("when are the opening hours today", 5);
    ASSERT_EQ(hits.size(), 5u);
    EXPECT_EQ(hits[0].record.tag, "hours_info");
    EXPECT_EQ(hits[1].record.tag, "location_info");
    for (std::size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].rank, (int)i + 1);
        if (i > 0) EXPECT_LE(hits[i].score, hits[i - 1].score);
    }
}

TEST(IndexBundleTest, EmptyBuildSearchesToNothing) {
    auto bundle = build_test_bundle({});
    EXPECT_EQ(bundle->index().vector_count(), 0u);
    EXPECT_EQ(bundle->config().dimension, 384u);
    EXPECT_TRUE(bundle->search("anything", 5).empty());
}

TEST(IndexBundleTest, BuildValidatesRecords) {
    std::vector<Record> records = {{"hours", "", {"We are open 9-5."}, RecordKind::Pattern}};
    EXPECT_THROW(build_test_bundle(records), IngestError);
}

TEST(IndexBundleTest, MisalignedPartsAreCorruption) {
    auto index = std::make_unique<VectorIndex>(4, BackendPreference::Scalar);
    index->add({{1, 0, 0, 0}, {0, 1, 0, 0}});
    MetadataStore one({hours_location_records().front()});
    EXPECT_THROW(IndexBundle({"hashing-bow-4", 4, 2}, std::move(index), one, std::make_shared<HashingEmbedder>(4)),
                 CorruptionError);
}

TEST(IndexHandleTest, UnloadedHandleRefusesSnapshots) {
    IndexHandle handle(test_codec());
    EXPECT_FALSE(handle.loaded());
    EXPECT_THROW(handle.snapshot(), NotLoadedError);
}

TEST(IndexHandleTest, FailedLoadStaysUnloaded) {
    TempDir tmp;
    IndexHandle handle(test_codec());
    EXPECT_FALSE(handle.try_load(tmp.path / "missing"));
    EXPECT_FALSE(handle.loaded());
    EXPECT_THROW(handle.load(tmp.path / "missing"), ConfigError);
    EXPECT_FALSE(handle.loaded());
}

TEST(IndexHandleTest, FailedReloadKeepsPreviousBundle) {
    TempDir tmp;
    build_test_bundle(campus_records())->save(test_codec(), tmp.path / "good");
    IndexHandle handle(test_codec());
    ASSERT_TRUE(handle.try_load(tmp.path / "good"));
    EXPECT_FALSE(handle.try_load(tmp.path / "missing"));
    ASSERT_TRUE(handle.loaded());
    EXPECT_EQ(handle.snapshot()->index().vector_count(), campus_records().size());
}

TEST(IndexHandleTest, SwapIsInvisibleToInFlightSearches) {
    IndexHandle handle(test_codec());
    auto small = build_test_bundle(hours_location_records());
    auto large = build_test_bundle(campus_records());
    handle.publish(small);

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto snap = handle.snapshot();
                if (snap->index().vector_count() != snap->metadata().size()) ++failures;
                auto hits = snap->search("opening hours", 10);
                if (hits.size() != snap->index().vector_count()) ++failures;
            }
        });
    }
    for (int i = 0; i < 200; ++i) handle.publish(i % 2 ? small : large);
    stop.store(true);
    for (auto& r : readers) r.join();
    EXPECT_EQ(failures.load(), 0);
}

TEST(IndexHandleTest, PublishRejectsNull) {
    IndexHandle handle(test_codec());
    EXPECT_THROW(handle.publish(nullptr), std::invalid_argument);
}
