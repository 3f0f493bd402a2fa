#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include "scigraph/storage/disk_cache.h"
#include "test_util/temp_dir.h"

namespace scigraph {
namespace storage {
namespace {

class DiskCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("disk_cache_test");
        cache_ = std::make_unique<DiskCache>(dir_->sub("cache"));
    }

    static core::PaperTable SamplePapers() {
        core::PaperTable table;
        for (int i = 0; i < 3; ++i) {
            core::Paper paper;
            paper.paper_id = "W" + std::to_string(i);
            paper.year = 2020 + i;
            paper.doctype = core::DocType::ARTICLE;
            paper.cited_by_count = i * 10;
            table.papers.push_back(paper);
        }
        return table;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::unique_ptr<DiskCache> cache_;
};

TEST_F(DiskCacheTest, PathNamesEncodeKindWindowAndSignature) {
    CacheKey key(ArtifactKind::PAPER_IDS, 5, "abc123");
    EXPECT_EQ(std::filesystem::path(cache_->path_for(key)).filename().string(),
              "filtered_paper_ids_5yr_abc123.parquet");
    EXPECT_EQ(std::filesystem::path(cache_->path_for(CacheKey(ArtifactKind::COAUTHOR_PAIRS, 3, "s")))
                  .filename().string(),
              "coauthor_pairs_3yr_s.parquet");
    EXPECT_EQ(std::filesystem::path(cache_->legacy_path(ArtifactKind::PAPER_IDS, 5)).filename().string(),
              "filtered_paper_ids_5yr.parquet");
}

TEST_F(DiskCacheTest, SignaturesNeverShareAFile) {
    CacheKey first(ArtifactKind::PAPER_TABLE, 5, "aaaa");
    CacheKey second(ArtifactKind::PAPER_TABLE, 5, "bbbb");
    CacheKey other_window(ArtifactKind::PAPER_TABLE, 6, "aaaa");
    EXPECT_NE(cache_->path_for(first), cache_->path_for(second));
    EXPECT_NE(cache_->path_for(first), cache_->path_for(other_window));

    ASSERT_TRUE(cache_->store_papers(first, SamplePapers()).ok());
    EXPECT_TRUE(cache_->load_papers(first).hit());
    EXPECT_EQ(cache_->load_papers(second).status, CacheLookup<core::PaperTable>::Status::MISS);
}

TEST_F(DiskCacheTest, IdSetRoundTrip) {
    CacheKey key(ArtifactKind::PAPER_IDS, 5, "sig");
    EXPECT_EQ(cache_->load_ids(key).status, CacheLookup<core::PaperIdSet>::Status::MISS);

    core::PaperIdSet ids = {"W1", "W2", "W3"};
    auto stored = cache_->store_ids(key, ids);
    ASSERT_TRUE(stored.ok()) << stored.error();
    EXPECT_TRUE(cache_->exists(cache_->path_for(key)));
    EXPECT_FALSE(cache_->exists(cache_->path_for(key) + ".tmp"));

    auto lookup = cache_->load_ids(key);
    ASSERT_TRUE(lookup.hit()) << lookup.detail;
    EXPECT_EQ(lookup.value, ids);
}

TEST_F(DiskCacheTest, EmptyIdSetIsAHit) {
    CacheKey key(ArtifactKind::PAPER_IDS, 0, "sig");
    ASSERT_TRUE(cache_->store_ids(key, {}).ok());
    auto lookup = cache_->load_ids(key);
    ASSERT_TRUE(lookup.hit());
    EXPECT_TRUE(lookup.value.empty());
}

TEST_F(DiskCacheTest, LoadedPaperTableCarriesProvenance) {
    CacheKey key(ArtifactKind::PAPER_TABLE, 4, "f00d");
    ASSERT_TRUE(cache_->store_papers(key, SamplePapers()).ok());

    auto lookup = cache_->load_papers(key);
    ASSERT_TRUE(lookup.hit()) << lookup.detail;
    ASSERT_EQ(lookup.value.size(), 3u);
    EXPECT_EQ(lookup.value.papers[2].cited_by_count, 20);
    ASSERT_TRUE(lookup.value.provenance.has_value());
    EXPECT_EQ(lookup.value.provenance->lookback_years, 4);
    EXPECT_EQ(lookup.value.provenance->signature, "f00d");
}

TEST_F(DiskCacheTest, EdgeColumnsFollowArtifactKind) {
    std::vector<core::EdgeRecord> edges = {core::EdgeRecord("A1", "A2", 2)};
    CacheKey pairs(ArtifactKind::COAUTHOR_PAIRS, 5, "sig");
    CacheKey citations(ArtifactKind::CITATION_EDGES, 5, "sig");
    ASSERT_TRUE(cache_->store_edges(pairs, edges).ok());
    ASSERT_TRUE(cache_->store_edges(citations, edges).ok());

    auto pair_lookup = cache_->load_edges(pairs);
    ASSERT_TRUE(pair_lookup.hit()) << pair_lookup.detail;
    EXPECT_EQ(pair_lookup.value, edges);
    EXPECT_TRUE(cache_->load_edges(citations).hit());
}

TEST_F(DiskCacheTest, UnreadableFileIsCorrupt) {
    CacheKey key(ArtifactKind::PAPER_IDS, 5, "sig");
    ASSERT_TRUE(cache_->ensure_directory().ok());
    std::ofstream(cache_->path_for(key), std::ios::binary) << "garbage";

    auto lookup = cache_->load_ids(key);
    EXPECT_TRUE(lookup.corrupt());
    EXPECT_FALSE(lookup.detail.empty());
}

TEST_F(DiskCacheTest, WrongSchemaIsCorrupt) {
    // An edge list has no paperid column
    CacheKey edges_key(ArtifactKind::CITATION_EDGES, 5, "sig");
    ASSERT_TRUE(cache_->store_edges(edges_key, {core::EdgeRecord("W1", "W2", 1)}).ok());
    std::filesystem::rename(cache_->path_for(edges_key),
                            cache_->path_for(CacheKey(ArtifactKind::PAPER_IDS, 5, "sig")));

    auto lookup = cache_->load_ids(CacheKey(ArtifactKind::PAPER_IDS, 5, "sig"));
    EXPECT_TRUE(lookup.corrupt());
}

TEST_F(DiskCacheTest, LegacyIdsAreReadable) {
    ASSERT_TRUE(cache_->ensure_directory().ok());
    // Stored under a key whose path is then moved to the untagged name
    CacheKey key(ArtifactKind::PAPER_IDS, 5, "sig");
    ASSERT_TRUE(cache_->store_ids(key, {"W1"}).ok());
    std::filesystem::rename(cache_->path_for(key), cache_->legacy_path(ArtifactKind::PAPER_IDS, 5));

    auto lookup = cache_->load_legacy_ids(5);
    ASSERT_TRUE(lookup.hit());
    EXPECT_EQ(lookup.value, core::PaperIdSet{"W1"});

    ASSERT_TRUE(cache_->remove(cache_->legacy_path(ArtifactKind::PAPER_IDS, 5)).ok());
    EXPECT_FALSE(cache_->load_legacy_ids(5).hit());
}

TEST_F(DiskCacheTest, StoreFailsWhenDirectoryIsAFile) {
    std::ofstream(dir_->sub("blocked")) << "file";
    DiskCache blocked(dir_->sub("blocked"));

    auto stored = blocked.store_ids(CacheKey(ArtifactKind::PAPER_IDS, 5, "sig"), {"W1"});
    EXPECT_FALSE(stored.ok());
}

} // namespace
} // namespace storage
} // namespace scigraph
