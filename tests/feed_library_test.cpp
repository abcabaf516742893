#include "core/FeedLibrary.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace ZenFeed;
using Testing::rssDocument;
using Testing::rssItem;

namespace {

class FeedLibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher_ = std::make_shared<Testing::FakeFetcher>();
        library_ = std::make_unique<FeedLibrary>(dir_.file("library.db"), fetcher_, SyncOptions{});
    }

    Feed subscribe(const std::string& url, const std::string& items, const std::string& category = "") {
        fetcher_->serve(url, rssDocument("Title of " + url, items));
        return library_->addFeed(url, category);
    }

    std::vector<Article> all() {
        return library_->search(ArticleQuery{}).collect();
    }

    Testing::TempDir dir_;
    std::shared_ptr<Testing::FakeFetcher> fetcher_;
    std::unique_ptr<FeedLibrary> library_;
};

}

TEST_F(FeedLibraryTest, AddFeedValidatesUrl) {
    try {
        library_->addFeed("ftp://example.com/feed");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidFeedUrl);
    }
    EXPECT_THROW(library_->addFeed("not a url"), ValidationError);

    Feed feed = library_->addFeed("  https://Example.COM/rss  ");
    EXPECT_EQ(feed.url, "https://example.com/rss");
    try {
        library_->addFeed("https://EXAMPLE.com/rss");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateFeedUrl);
    }
    EXPECT_EQ(library_->feeds().size(), 1u);
}

TEST_F(FeedLibraryTest, CategoriesAreCreatedOnDemand) {
    Feed tech = library_->addFeed("https://a.example/rss", "Tech");
    Feed again = library_->addFeed("https://b.example/rss", " tech ");
    Feed loose = library_->addFeed("https://c.example/rss", "Uncategorized");

    ASSERT_TRUE(tech.categoryId);
    EXPECT_EQ(again.categoryId, tech.categoryId);
    EXPECT_FALSE(loose.categoryId);
    ASSERT_EQ(library_->categories().size(), 1u);
    EXPECT_EQ(library_->categories()[0].name, "Tech");

    EXPECT_THROW(library_->createCategory("uncategorized"), ValidationError);
    EXPECT_THROW(library_->createCategory("   "), ValidationError);
    EXPECT_THROW(library_->createCategory("bad\nname"), ValidationError);
    EXPECT_EQ(library_->createCategory("TECH").id, *tech.categoryId);
}

TEST_F(FeedLibraryTest, RenameAndRemoveCategory) {
    Feed feed = library_->addFeed("https://a.example/rss", "Tech");
    Category news = library_->createCategory("News");

    EXPECT_THROW(library_->renameCategory(*feed.categoryId, "news"), ValidationError);
    library_->renameCategory(*feed.categoryId, "Technology");
    EXPECT_EQ(library_->categories().size(), 2u);

    library_->removeCategory(*feed.categoryId);
    EXPECT_FALSE(library_->feed(feed.id)->categoryId);
    EXPECT_THROW(library_->removeCategory(*feed.categoryId), ValidationError);

    library_->moveFeed(feed.id, "News");
    EXPECT_EQ(library_->feed(feed.id)->categoryId, std::optional<std::int64_t>(news.id));
    library_->moveFeed(feed.id, "");
    EXPECT_FALSE(library_->feed(feed.id)->categoryId);
    EXPECT_THROW(library_->moveFeed(9999, "News"), ValidationError);
}

TEST_F(FeedLibraryTest, ResyncKeepsIdentityAndUserState) {
    Feed feed = subscribe("https://a.example/rss", rssItem("g1", "Draft title", "first") + rssItem("g2", "Other", "x"));
    library_->syncAll();
    auto before = all();
    ASSERT_EQ(before.size(), 2u);

    auto draft = std::find_if(before.begin(), before.end(), [](const Article& a) { return a.title == "Draft title"; });
    ASSERT_NE(draft, before.end());
    std::int64_t id = draft->id;
    EXPECT_TRUE(library_->toggleSaved(id));
    library_->markRead(ReadScope::Article, id);
    library_->storeFullContent(id, "full reader text");

    fetcher_->serve(feed.url, rssDocument("Title of a", rssItem("g1", "Final title", "second") +
                                                          rssItem("g2", "Other", "x")));
    SyncResult result = library_->syncOne(feed.id);
    EXPECT_EQ(result.articlesUpdated, 1);
    EXPECT_EQ(result.articlesUnchanged, 1);

    auto updated = library_->article(id);
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->title, "Final title");
    EXPECT_EQ(updated->content, "second");
    EXPECT_TRUE(updated->isSaved);
    EXPECT_TRUE(updated->isRead);
    EXPECT_EQ(updated->fullContent, std::optional<std::string>("full reader text"));
    EXPECT_EQ(updated->firstSeenAt, draft->firstSeenAt);
    EXPECT_EQ(all().size(), 2u);
}

TEST_F(FeedLibraryTest, OneBrokenFeedDoesNotStopThePass) {
    Feed good = subscribe("https://good.example/rss", rssItem("g1", "One", "x"));
    Feed bad = library_->addFeed("https://bad.example/rss");
    fetcher_->fail(bad.url, ErrorCode::Timeout);

    auto results = library_->syncAll();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(library_->unreadCounts()[good.id], 1);
    EXPECT_TRUE(library_->feed(bad.id)->lastError);
    EXPECT_EQ(library_->feed(good.id)->title, "Title of https://good.example/rss");
}

TEST_F(FeedLibraryTest, ImportReportsEveryItem) {
    library_->addFeed("https://existing.example/rss");

    ImportBatch batch = OpmlImporter::fromMemory(R"(<opml version="2.0"><body>
        <outline text="Tech">
          <outline text="A" xmlUrl="https://a.example/rss"/>
          <outline text="Existing" xmlUrl="https://existing.example/rss"/>
          <outline text="Broken" xmlUrl="gopher://old.example/"/>
        </outline>
        <outline text="Elsewhere">
          <outline text="A again" xmlUrl="https://a.example/rss"/>
        </outline>
    </body></opml>)");

    ImportReport report = library_->importFeeds(batch);
    ASSERT_EQ(report.items.size(), 4u);
    EXPECT_EQ(report.count(ImportStatus::Added), 1);
    EXPECT_EQ(report.count(ImportStatus::SkippedExisting), 1);
    EXPECT_EQ(report.count(ImportStatus::Rejected), 1);
    EXPECT_EQ(report.count(ImportStatus::SkippedDuplicate), 1);

    EXPECT_EQ(library_->feeds().size(), 2u);
    ASSERT_TRUE(report.items[0].feedId);
    auto imported = library_->feed(*report.items[0].feedId);
    ASSERT_TRUE(imported);
    EXPECT_EQ(imported->title, "A");
    ASSERT_EQ(library_->categories().size(), 1u);
    EXPECT_EQ(imported->categoryId, std::optional<std::int64_t>(library_->categories()[0].id));
}

TEST_F(FeedLibraryTest, MarkReadScopes) {
    Feed tech = subscribe("https://tech.example/rss", rssItem("t1", "T1", "") + rssItem("t2", "T2", ""), "Tech");
    Feed loose = subscribe("https://loose.example/rss", rssItem("l1", "L1", ""));
    library_->syncAll();

    EXPECT_EQ(library_->markRead(ReadScope::Uncategorized), 1);
    EXPECT_EQ(library_->unreadCounts().count(loose.id), 0u);
    EXPECT_EQ(library_->markRead(ReadScope::Category, *tech.categoryId), 2);
    EXPECT_EQ(library_->markRead(ReadScope::All), 0);

    auto articles = all();
    library_->markUnread(articles[0].id);
    EXPECT_EQ(library_->markRead(ReadScope::Feed, articles[0].feedId), 1);

    EXPECT_THROW(library_->markRead(ReadScope::Article, 9999), ValidationError);
    EXPECT_THROW(library_->markRead(ReadScope::Feed, 9999), ValidationError);
    EXPECT_THROW(library_->markRead(ReadScope::Category, 9999), ValidationError);
    EXPECT_THROW(library_->markUnread(9999), ValidationError);
    EXPECT_THROW(library_->toggleSaved(9999), ValidationError);
    EXPECT_THROW(library_->storeFullContent(9999, "x"), ValidationError);
}

TEST_F(FeedLibraryTest, SearchAndRecentArticles) {
    subscribe("https://a.example/rss",
              rssItem("a1", "Kernel release notes", "", "Mon, 06 Jan 2025 10:00:00 GMT") +
                  rssItem("a2", "Gardening tips", "about the kernel of a seed", "Tue, 07 Jan 2025 10:00:00 GMT") +
                  rssItem("a3", "Weather", "sunny", "Wed, 08 Jan 2025 10:00:00 GMT"));
    library_->syncAll();

    auto hits = library_->search("kernel").collect();
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].title, "Gardening tips");
    EXPECT_EQ(hits[1].title, "Kernel release notes");

    auto recent = library_->articlesSince(fromUnixSeconds(1736244000));  // 2025-01-07 10:00 UTC
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].title, "Weather");
    EXPECT_EQ(recent[0].feedTitle, "Title of https://a.example/rss");
}

TEST_F(FeedLibraryTest, RemovingFeedDropsItsArticles) {
    Feed feed = subscribe("https://a.example/rss", rssItem("g1", "One", ""));
    library_->syncAll();
    ASSERT_EQ(all().size(), 1u);

    library_->removeFeed(feed.id);
    EXPECT_TRUE(all().empty());
    EXPECT_TRUE(library_->feeds().empty());
    EXPECT_THROW(library_->removeFeed(feed.id), ValidationError);
    EXPECT_THROW(library_->syncOne(feed.id), ValidationError);
}

TEST_F(FeedLibraryTest, BoolSettings) {
    EXPECT_TRUE(library_->boolSetting("hide_read", true));
    library_->setSetting("hide_read", " Yes ");
    EXPECT_TRUE(library_->boolSetting("hide_read"));
    library_->setSetting("hide_read", "off");
    EXPECT_FALSE(library_->boolSetting("hide_read", true));
    EXPECT_EQ(library_->setting("hide_read"), std::optional<std::string>("off"));
}

TEST_F(FeedLibraryTest, BriefingFollowsItsSetting) {
    subscribe("https://a.example/rss", rssItem("a1", "Kernel release notes", "new scheduler",
                                               "Mon, 06 Jan 2025 10:00:00 GMT"));
    library_->syncAll();
    Timestamp now = fromUnixSeconds(1736157600 + 3600);  // an hour after publication

    EXPECT_FALSE(library_->briefingInput(24, now));

    library_->setSetting(kBriefingSetting, "true");
    auto input = library_->briefingInput(24, now);
    ASSERT_TRUE(input);
    EXPECT_NE(input->find("Title: Kernel release notes\n"), std::string::npos);
    EXPECT_NE(input->find("Content: new scheduler\n"), std::string::npos);

    auto twoDaysLater = library_->briefingInput(24, fromUnixSeconds(1736157600 + 48 * 3600));
    ASSERT_TRUE(twoDaysLater);
    EXPECT_TRUE(twoDaysLater->empty());
}

TEST_F(FeedLibraryTest, HugeBriefingWindowIsClamped) {
    subscribe("https://a.example/rss", rssItem("a1", "Old news", "", "Mon, 06 Jan 2025 10:00:00 GMT"));
    library_->syncAll();
    library_->setSetting(kBriefingSetting, "on");

    auto input = library_->briefingInput(999999999999999999LL, fromUnixSeconds(1736157600 + 3600));
    ASSERT_TRUE(input);
    EXPECT_NE(input->find("Old news"), std::string::npos);
}
