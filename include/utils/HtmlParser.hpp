#pragma once
#include <string>
#include <libxml/HTMLparser.h>

namespace ZenFeed {

// Turns feed HTML into readable plain text with light markdown:
// paragraphs, line breaks, "- " list items, "#" headings and [text](href) links.
class HtmlParser {
public:
    HtmlParser();
    ~HtmlParser();

    HtmlParser(const HtmlParser&) = delete;
    HtmlParser& operator=(const HtmlParser&) = delete;

    bool parse(const std::string& html);
    std::string toText() const;

    static std::string htmlToText(const std::string& html);

private:
    htmlDocPtr doc_;
    void cleanup();
};

}
