#pragma once
#include "core/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ZenFeed {

enum class FeedDialect {
    Rss2,  // <rss>, including 0.9x
    Atom,  // <feed>
    Rdf    // <rdf:RDF>, RSS 1.0
};

const char* dialectName(FeedDialect dialect);

struct ParsedFeed {
    FeedDialect dialect = FeedDialect::Rss2;
    std::string title;
    std::vector<RawArticle> articles;  // document order
    int skippedEntries = 0;
};

class FeedParser {
public:
    // Pure function of the root element. nullopt for anything that is not a feed.
    static std::optional<FeedDialect> detectDialect(const std::string& rootName,
                                                    const std::string& rootNamespace);

    // Throws ParseError (MalformedDocument, UnsupportedDialect). Entries that
    // cannot be identified are skipped and counted. Dates the feed does not
    // provide default to fetchedAt.
    static ParsedFeed parse(const std::string& document, Timestamp fetchedAt);

    // libxml2 global setup; safe to call repeatedly.
    static void globalInit();
};

}
