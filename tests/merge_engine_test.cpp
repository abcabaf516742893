#include "services/MergeEngine.hpp"
#include "utils/StringUtils.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace ZenFeed;

namespace {

RawArticle raw(const std::string& guid, const std::string& link, const std::string& title,
               const std::string& content = "body", std::int64_t published = 1736157600) {
    RawArticle a;
    a.guid = guid;
    a.link = link;
    a.title = title;
    a.content = content;
    a.publishedAt = fromUnixSeconds(published);
    a.publishedKnown = true;
    return a;
}

class MergeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<FeedStore>(dir_.file("merge.db"));
        store_->migrate();
        feedId_ = store_->insertFeed("https://example.com/rss", "", std::nullopt, Clock::now()).id;
    }

    Testing::TempDir dir_;
    std::unique_ptr<FeedStore> store_;
    std::int64_t feedId_ = 0;
};

}

TEST(CanonicalKeyTest, PrefersGuidThenLinkThenTitle) {
    EXPECT_EQ(MergeEngine::canonicalKey(raw("  abc-123 ", "https://x.example/1", "T")), "guid:abc-123");

    std::string byLink = MergeEngine::canonicalKey(raw("", "https://x.example/1", "T"));
    EXPECT_EQ(byLink, "link:" + StringUtils::toHex(StringUtils::fnv1a64("https://x.example/1")));

    std::string byTitle = MergeEngine::canonicalKey(raw("", "", "Some  Title"));
    EXPECT_EQ(byTitle.rfind("title:", 0), 0u);
}

TEST(CanonicalKeyTest, LinkKeyIgnoresCosmeticDifferences) {
    EXPECT_EQ(MergeEngine::canonicalKey(raw("", "HTTPS://X.example/post/#top", "A")),
              MergeEngine::canonicalKey(raw("", "https://x.example/post", "B")));
}

TEST(CanonicalKeyTest, TitleKeyUsesDayAndNormalizedTitle) {
    RawArticle morning = raw("", "", "Daily  Digest", "x", 1736150000);
    RawArticle evening = raw("", "", "daily digest", "y", 1736190000);
    EXPECT_EQ(MergeEngine::canonicalKey(morning), MergeEngine::canonicalKey(evening));

    RawArticle nextDay = raw("", "", "Daily Digest", "x", 1736150000 + 86400);
    EXPECT_NE(MergeEngine::canonicalKey(morning), MergeEngine::canonicalKey(nextDay));

    // Without a feed-provided date the fetch time does not take part in identity.
    RawArticle undatedA = raw("", "", "Daily Digest", "x", 1000000000);
    RawArticle undatedB = raw("", "", "Daily Digest", "x", 1800000000);
    undatedA.publishedKnown = false;
    undatedB.publishedKnown = false;
    EXPECT_EQ(MergeEngine::canonicalKey(undatedA), MergeEngine::canonicalKey(undatedB));
}

TEST_F(MergeEngineTest, InsertsThenIsIdempotent) {
    std::vector<RawArticle> batch = {raw("g1", "https://x.example/1", "One"),
                                     raw("g2", "https://x.example/2", "Two")};
    MergeStats first = MergeEngine::merge(*store_, feedId_, batch, fromUnixSeconds(5000));
    EXPECT_EQ(first.added, 2);
    EXPECT_EQ(first.updated, 0);

    MergeStats second = MergeEngine::merge(*store_, feedId_, batch, fromUnixSeconds(6000));
    EXPECT_EQ(second.added, 0);
    EXPECT_EQ(second.updated, 0);
    EXPECT_EQ(second.unchanged, 2);
    EXPECT_EQ(store_->countArticles(feedId_), 2u);
}

TEST_F(MergeEngineTest, UpdateKeepsIdentityAndUserState) {
    MergeEngine::merge(*store_, feedId_, {raw("g1", "https://x.example/1", "Draft", "v1")}, fromUnixSeconds(5000));
    auto stored = store_->findArticleByKey(feedId_, "guid:g1");
    ASSERT_TRUE(stored);
    store_->setArticleRead(stored->id, true);
    store_->toggleSaved(stored->id);
    store_->setFullContent(stored->id, "reader text");

    MergeStats stats = MergeEngine::merge(*store_, feedId_, {raw("g1", "https://x.example/1", "Final", "v2")},
                                          fromUnixSeconds(9000));
    EXPECT_EQ(stats.updated, 1);
    EXPECT_EQ(stats.added, 0);

    auto updated = store_->findArticle(stored->id);
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->title, "Final");
    EXPECT_EQ(updated->content, "v2");
    EXPECT_TRUE(updated->isRead);
    EXPECT_TRUE(updated->isSaved);
    EXPECT_EQ(updated->fullContent, std::optional<std::string>("reader text"));
    EXPECT_EQ(toUnixSeconds(updated->firstSeenAt), 5000);
    EXPECT_EQ(store_->countArticles(feedId_), 1u);
}

TEST_F(MergeEngineTest, FallbackDateDoesNotCountAsChange) {
    RawArticle undated = raw("g1", "https://x.example/1", "One");
    undated.publishedKnown = false;
    undated.publishedAt = fromUnixSeconds(5000);
    MergeEngine::merge(*store_, feedId_, {undated}, fromUnixSeconds(5000));

    undated.publishedAt = fromUnixSeconds(7000);
    MergeStats stats = MergeEngine::merge(*store_, feedId_, {undated}, fromUnixSeconds(7000));
    EXPECT_EQ(stats.unchanged, 1);
    EXPECT_EQ(stats.updated, 0);
    EXPECT_EQ(toUnixSeconds(store_->findArticleByKey(feedId_, "guid:g1")->publishedAt), 5000);
}

TEST_F(MergeEngineTest, AbsentArticlesAreKept) {
    MergeEngine::merge(*store_, feedId_, {raw("g1", "", "One"), raw("g2", "", "Two")}, fromUnixSeconds(5000));
    MergeStats stats = MergeEngine::merge(*store_, feedId_, {raw("g2", "", "Two")}, fromUnixSeconds(6000));
    EXPECT_EQ(stats.unchanged, 1);
    EXPECT_EQ(store_->countArticles(feedId_), 2u);
}

TEST_F(MergeEngineTest, RepeatedKeyInBatchIsSkipped) {
    MergeStats stats = MergeEngine::merge(
        *store_, feedId_, {raw("same", "", "First copy"), raw("same", "", "Second copy")}, fromUnixSeconds(5000));
    EXPECT_EQ(stats.added, 1);
    EXPECT_EQ(stats.duplicates, 1);
    EXPECT_EQ(store_->findArticleByKey(feedId_, "guid:same")->title, "First copy");
}

TEST_F(MergeEngineTest, RetitledFallbackArticleBecomesNew) {
    MergeEngine::merge(*store_, feedId_, {raw("", "", "Original headline")}, fromUnixSeconds(5000));
    MergeStats stats = MergeEngine::merge(*store_, feedId_, {raw("", "", "Corrected headline")},
                                          fromUnixSeconds(6000));
    EXPECT_EQ(stats.added, 1);
    EXPECT_EQ(store_->countArticles(feedId_), 2u);
}

TEST_F(MergeEngineTest, FailedBatchRollsBackEntirely) {
    std::int64_t otherFeed = feedId_ + 1000;  // not stored: foreign key fails
    EXPECT_THROW(MergeEngine::merge(*store_, otherFeed, {raw("g1", "", "One")}, fromUnixSeconds(5000)),
                 StorageError);
    EXPECT_FALSE(store_->database().inTransaction());

    MergeStats stats = MergeEngine::merge(*store_, feedId_, {raw("g1", "", "One")}, fromUnixSeconds(5000));
    EXPECT_EQ(stats.added, 1);
}
