#include "services/OpmlImporter.hpp"
#include "TestSupport.hpp"
#include <fstream>
#include <gtest/gtest.h>

using namespace ZenFeed;

namespace {

const char* kOpml = R"(<?xml version="1.0" encoding="UTF-8"?>
<opml version="2.0">
  <head><title>Subscriptions</title></head>
  <body>
    <outline text="Loose Feed" xmlUrl="https://loose.example/rss"/>
    <outline text="Tech" title="Tech">
      <outline text="Hacker News" xmlUrl="https://hn.example/rss" htmlUrl="https://hn.example/"/>
      <outline>
        <outline title="Nested Without Folder Name" xmlUrl="https://nested.example/atom"/>
      </outline>
      <outline text="Linux">
        <outline text="9to5" xmlUrl="https://9to5.example/feed"/>
      </outline>
    </outline>
    <outline text="News">
      <outline text="Hacker News again" xmlUrl="HTTPS://HN.example/rss"/>
    </outline>
  </body>
</opml>)";

}

TEST(OpmlImporterTest, CategoriesComeFromEnclosingOutlines) {
    ImportBatch batch = OpmlImporter::fromMemory(kOpml);
    ASSERT_EQ(batch.feeds.size(), 4u);

    EXPECT_EQ(batch.feeds[0].url, "https://loose.example/rss");
    EXPECT_EQ(batch.feeds[0].categoryName, "");
    EXPECT_EQ(batch.feeds[0].title, "Loose Feed");

    EXPECT_EQ(batch.feeds[1].url, "https://hn.example/rss");
    EXPECT_EQ(batch.feeds[1].categoryName, "Tech");

    // An unnamed container keeps its parent's category.
    EXPECT_EQ(batch.feeds[2].categoryName, "Tech");
    EXPECT_EQ(batch.feeds[2].title, "Nested Without Folder Name");

    // The innermost named container wins.
    EXPECT_EQ(batch.feeds[3].categoryName, "Linux");
}

TEST(OpmlImporterTest, RepeatedUrlsAreSetAside) {
    ImportBatch batch = OpmlImporter::fromMemory(kOpml);
    ASSERT_EQ(batch.duplicates.size(), 1u);
    EXPECT_EQ(batch.duplicates[0].url, "HTTPS://HN.example/rss");
    EXPECT_EQ(batch.duplicates[0].categoryName, "News");
}

TEST(OpmlImporterTest, MissingBodyFallsBackToRoot) {
    ImportBatch batch = OpmlImporter::fromMemory(
        "<opml><outline text=\"Only\" xmlUrl=\"https://only.example/rss\"/></opml>");
    ASSERT_EQ(batch.feeds.size(), 1u);
    EXPECT_EQ(batch.feeds[0].url, "https://only.example/rss");
}

TEST(OpmlImporterTest, MalformedInput) {
    try {
        OpmlImporter::fromMemory("<opml><body><outline xmlUrl=\"x\"></body>");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MalformedDocument);
    }
    EXPECT_THROW(OpmlImporter::fromFile("/nonexistent/zenfeed/subscriptions.opml"), ParseError);
}

TEST(OpmlImporterTest, ReadsFromFile) {
    Testing::TempDir dir;
    std::string path = dir.file("subs.opml");
    {
        std::ofstream out(path);
        out << kOpml;
    }
    ImportBatch batch = OpmlImporter::fromFile(path);
    EXPECT_EQ(batch.feeds.size(), 4u);
}
