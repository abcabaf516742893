#include "services/FeedParser.hpp"
#include <gtest/gtest.h>

using namespace ZenFeed;

namespace {

constexpr std::int64_t kMonday10 = 1736157600;  // 2025-01-06 10:00:00 UTC

const Timestamp kFetchedAt = fromUnixSeconds(1750000000);

const char* kRss = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0"
     xmlns:content="http://purl.org/rss/1.0/modules/content/"
     xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel>
    <title>  Example
      News </title>
    <link>https://example.com/</link>
    <item>
      <guid isPermaLink="false"> id-1 </guid>
      <title>First &amp; foremost</title>
      <link>https://example.com/1</link>
      <description>Short summary</description>
      <content:encoded><![CDATA[<p>Full <b>body</b></p>]]></content:encoded>
      <pubDate>Mon, 06 Jan 2025 10:00:00 GMT</pubDate>
    </item>
    <item>
      <title>No date</title>
      <link>https://example.com/2</link>
      <description>&lt;p&gt;Escaped html&lt;/p&gt;</description>
      <dc:date>sometime last week</dc:date>
    </item>
    <item>
      <description>Nothing to identify this entry by</description>
    </item>
    <item>
      <link>https://example.com/4</link>
      <dc:date>2025-01-06T10:00:00Z</dc:date>
    </item>
  </channel>
</rss>)";

const char* kAtom = R"(<?xml version="1.0" encoding="utf-8"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <title type="text">Atom Blog</title>
  <entry>
    <id>urn:uuid:1</id>
    <title type="html">&lt;b&gt;Bold&lt;/b&gt; title</title>
    <link rel="self" href="https://example.com/self/1"/>
    <link rel="alternate" href="https://example.com/posts/1"/>
    <updated>2025-01-06T10:00:00Z</updated>
    <summary>Summary text</summary>
    <content type="xhtml"><div xmlns="http://www.w3.org/1999/xhtml"><p>Para one</p><p>Para two</p></div></content>
  </entry>
  <entry>
    <id>urn:uuid:2</id>
    <title>Second</title>
    <link href="https://example.com/posts/2"/>
    <published>2025-01-05T08:00:00+02:00</published>
    <updated>2025-01-06T10:00:00Z</updated>
    <summary>Only summary</summary>
  </entry>
</feed>)";

const char* kRdf = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
         xmlns="http://purl.org/rss/1.0/"
         xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel rdf:about="https://example.org/">
    <title>RDF Site</title>
    <link>https://example.org/</link>
  </channel>
  <item rdf:about="https://example.org/a">
    <title>Item A</title>
    <link>https://example.org/a</link>
    <description>Desc A</description>
    <dc:date>2025-01-06T10:00:00Z</dc:date>
  </item>
  <item rdf:about="https://example.org/b">
    <title>Item B</title>
    <link>https://example.org/b</link>
  </item>
</rdf:RDF>)";

}

TEST(FeedParserTest, DetectsDialectFromRootElement) {
    EXPECT_EQ(FeedParser::detectDialect("rss", ""), FeedDialect::Rss2);
    EXPECT_EQ(FeedParser::detectDialect("feed", "http://www.w3.org/2005/Atom"), FeedDialect::Atom);
    EXPECT_EQ(FeedParser::detectDialect("RDF", "http://www.w3.org/1999/02/22-rdf-syntax-ns#"), FeedDialect::Rdf);
    EXPECT_FALSE(FeedParser::detectDialect("RDF", "urn:something-else"));
    EXPECT_FALSE(FeedParser::detectDialect("html", ""));
}

TEST(FeedParserTest, ParsesRss2) {
    ParsedFeed feed = FeedParser::parse(kRss, kFetchedAt);
    EXPECT_EQ(feed.dialect, FeedDialect::Rss2);
    EXPECT_EQ(feed.title, "Example News");
    ASSERT_EQ(feed.articles.size(), 3u);
    EXPECT_EQ(feed.skippedEntries, 1);

    const RawArticle& first = feed.articles[0];
    EXPECT_EQ(first.guid, "id-1");
    EXPECT_EQ(first.title, "First & foremost");
    EXPECT_EQ(first.link, "https://example.com/1");
    EXPECT_EQ(first.content, "Full body");
    EXPECT_TRUE(first.publishedKnown);
    EXPECT_EQ(toUnixSeconds(first.publishedAt), kMonday10);

    const RawArticle& second = feed.articles[1];
    EXPECT_TRUE(second.guid.empty());
    EXPECT_EQ(second.content, "Escaped html");
    EXPECT_FALSE(second.publishedKnown);
    EXPECT_EQ(second.publishedAt, kFetchedAt);

    const RawArticle& third = feed.articles[2];
    EXPECT_EQ(third.title, "Untitled");
    EXPECT_EQ(third.link, "https://example.com/4");
    EXPECT_TRUE(third.publishedKnown);
}

TEST(FeedParserTest, ParsesAtom) {
    ParsedFeed feed = FeedParser::parse(kAtom, kFetchedAt);
    EXPECT_EQ(feed.dialect, FeedDialect::Atom);
    EXPECT_EQ(feed.title, "Atom Blog");
    ASSERT_EQ(feed.articles.size(), 2u);

    const RawArticle& first = feed.articles[0];
    EXPECT_EQ(first.guid, "urn:uuid:1");
    EXPECT_EQ(first.title, "Bold title");
    EXPECT_EQ(first.link, "https://example.com/posts/1");
    EXPECT_EQ(first.content, "Para one\n\nPara two");
    EXPECT_EQ(toUnixSeconds(first.publishedAt), kMonday10);

    const RawArticle& second = feed.articles[1];
    EXPECT_EQ(second.link, "https://example.com/posts/2");
    EXPECT_EQ(second.content, "Only summary");
    // <published> wins over <updated>.
    EXPECT_EQ(toUnixSeconds(second.publishedAt), kMonday10 - 28 * 3600);
}

TEST(FeedParserTest, ParsesRdf) {
    ParsedFeed feed = FeedParser::parse(kRdf, kFetchedAt);
    EXPECT_EQ(feed.dialect, FeedDialect::Rdf);
    EXPECT_EQ(feed.title, "RDF Site");
    ASSERT_EQ(feed.articles.size(), 2u);
    EXPECT_EQ(feed.articles[0].guid, "https://example.org/a");
    EXPECT_EQ(feed.articles[0].title, "Item A");
    EXPECT_EQ(feed.articles[0].content, "Desc A");
    EXPECT_TRUE(feed.articles[0].publishedKnown);
    EXPECT_EQ(feed.articles[1].guid, "https://example.org/b");
    EXPECT_FALSE(feed.articles[1].publishedKnown);
}

TEST(FeedParserTest, MalformedDocumentFailsWholeFeed) {
    try {
        FeedParser::parse("<rss><channel><item><title>cut off", kFetchedAt);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MalformedDocument);
    }
    EXPECT_THROW(FeedParser::parse("", kFetchedAt), ParseError);
    EXPECT_THROW(FeedParser::parse("definitely not xml", kFetchedAt), ParseError);
}

TEST(FeedParserTest, UnknownRootIsUnsupported) {
    try {
        FeedParser::parse("<html><body><p>hello</p></body></html>", kFetchedAt);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedDialect);
    }
}

TEST(FeedParserTest, EmptyChannelYieldsNoArticles) {
    ParsedFeed feed = FeedParser::parse("<rss version=\"2.0\"><channel><title>Quiet</title></channel></rss>",
                                        kFetchedAt);
    EXPECT_EQ(feed.title, "Quiet");
    EXPECT_TRUE(feed.articles.empty());
    EXPECT_EQ(feed.skippedEntries, 0);
}
