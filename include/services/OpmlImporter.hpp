#pragma once
#include "core/Types.hpp"
#include <string>
#include <vector>

namespace ZenFeed {

struct ImportBatch {
    std::vector<FeedSpec> feeds;       // first occurrence of each url, document order
    std::vector<FeedSpec> duplicates;  // later occurrences
};

// Reads OPML subscription lists. Outlines with an xmlUrl are feeds; an
// outline without one but with a text/title names the category of the feeds
// nested in it.
class OpmlImporter {
public:
    // Throws ParseError(MalformedDocument).
    static ImportBatch fromFile(const std::string& path);
    static ImportBatch fromMemory(const std::string& document);
};

}
