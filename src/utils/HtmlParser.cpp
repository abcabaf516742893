#include "utils/HtmlParser.hpp"
#include "utils/StringUtils.hpp"
#include <cstring>
#include <libxml/tree.h>

namespace ZenFeed {

namespace {

bool nameIs(xmlNodePtr node, const char* name) {
    return node->name && xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

bool isSkipped(xmlNodePtr node) {
    static const char* skipped[] = {"script", "style", "noscript", "iframe", "head", "object", "template", "svg"};
    for (const char* s : skipped) {
        if (nameIs(node, s)) return true;
    }
    return false;
}

bool isBlock(xmlNodePtr node) {
    static const char* blocks[] = {"p", "div", "section", "article", "header", "footer", "blockquote",
                                   "pre", "ul", "ol", "table", "tr", "figure", "figcaption", "hr",
                                   "dl", "dt", "dd", "main", "aside", "nav", "address"};
    for (const char* b : blocks) {
        if (nameIs(node, b)) return true;
    }
    return false;
}

int headingLevel(xmlNodePtr node) {
    if (!node->name || std::strlen(reinterpret_cast<const char*>(node->name)) != 2) return 0;
    const char* n = reinterpret_cast<const char*>(node->name);
    if ((n[0] == 'h' || n[0] == 'H') && n[1] >= '1' && n[1] <= '6') return n[1] - '0';
    return 0;
}

std::string attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

class TextBuilder {
public:
    void text(const std::string& raw, bool preformatted) {
        if (preformatted) {
            out_ += raw;
            return;
        }
        for (char c : raw) {
            bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
            if (space) {
                if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n') out_ += ' ';
            } else {
                out_ += c;
            }
        }
    }

    void lineBreak() {
        trimTrailingSpaces();
        if (!out_.empty() && out_.back() != '\n') out_ += '\n';
    }

    void paragraph() {
        trimTrailingSpaces();
        if (out_.empty()) return;
        while (out_.size() < 2 || out_.compare(out_.size() - 2, 2, "\n\n") != 0) out_ += '\n';
    }

    void raw(const std::string& s) { out_ += s; }
    size_t mark() const { return out_.size(); }
    std::string take(size_t from) {
        std::string piece = out_.substr(from);
        out_.erase(from);
        return piece;
    }

    std::string finish() {
        std::string result;
        result.reserve(out_.size());
        int newlines = 0;
        for (char c : out_) {
            if (c == '\n') {
                while (!result.empty() && result.back() == ' ') result.pop_back();
                if (++newlines <= 2) result += c;
            } else {
                newlines = 0;
                result += c;
            }
        }
        return StringUtils::trim(result);
    }

private:
    void trimTrailingSpaces() {
        while (!out_.empty() && out_.back() == ' ') out_.pop_back();
    }

    std::string out_;
};

void render(xmlNodePtr node, TextBuilder& out, int preDepth) {
    for (xmlNodePtr n = node; n; n = n->next) {
        if (n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE) {
            if (n->content) out.text(reinterpret_cast<const char*>(n->content), preDepth > 0);
            continue;
        }
        if (n->type != XML_ELEMENT_NODE) continue;
        if (isSkipped(n)) continue;

        if (nameIs(n, "br")) {
            out.lineBreak();
            continue;
        }
        if (int level = headingLevel(n)) {
            out.paragraph();
            out.raw(std::string(static_cast<size_t>(level), '#') + " ");
            render(n->children, out, preDepth);
            out.paragraph();
            continue;
        }
        if (nameIs(n, "li")) {
            out.lineBreak();
            out.raw("- ");
            render(n->children, out, preDepth);
            out.lineBreak();
            continue;
        }
        if (nameIs(n, "a")) {
            std::string href = attribute(n, "href");
            size_t start = out.mark();
            render(n->children, out, preDepth);
            std::string label = StringUtils::trim(out.take(start));
            if (label.empty()) continue;
            bool absolute = StringUtils::startsWith(href, "http://") || StringUtils::startsWith(href, "https://");
            if (absolute && label != href) {
                out.text(" ", false);
                out.raw("[" + label + "](" + href + ")");
            } else {
                out.text(" ", false);
                out.raw(label);
            }
            continue;
        }
        if (nameIs(n, "td") || nameIs(n, "th")) {
            render(n->children, out, preDepth);
            out.text(" ", false);
            continue;
        }

        bool block = isBlock(n);
        if (block) out.paragraph();
        render(n->children, out, preDepth + (nameIs(n, "pre") ? 1 : 0));
        if (block) out.paragraph();
    }
}

}

HtmlParser::HtmlParser() : doc_(nullptr) {}
HtmlParser::~HtmlParser() { cleanup(); }

void HtmlParser::cleanup() {
    if (doc_) { xmlFreeDoc(doc_); doc_ = nullptr; }
}

bool HtmlParser::parse(const std::string& html) {
    cleanup();
    if (html.empty()) return false;
    doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    return doc_ != nullptr;
}

std::string HtmlParser::toText() const {
    if (!doc_) return "";
    TextBuilder out;
    render(xmlDocGetRootElement(doc_), out, 0);
    return StringUtils::sanitizeUtf8(out.finish());
}

std::string HtmlParser::htmlToText(const std::string& html) {
    if (html.find('<') == std::string::npos && html.find('&') == std::string::npos) {
        return StringUtils::sanitizeUtf8(StringUtils::collapseWhitespace(html));
    }
    HtmlParser parser;
    if (!parser.parse(html)) return StringUtils::sanitizeUtf8(StringUtils::collapseWhitespace(html));
    return parser.toText();
}

}
