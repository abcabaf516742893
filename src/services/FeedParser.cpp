#include "services/FeedParser.hpp"
#include "utils/DateParser.hpp"
#include "utils/HtmlParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>
#include <mutex>

namespace ZenFeed {

namespace {

const char* kAtomNs = "http://www.w3.org/2005/Atom";
const char* kRdfNs = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
const char* kRss1Ns = "http://purl.org/rss/1.0/";
const char* kContentNs = "http://purl.org/rss/1.0/modules/content/";
const char* kDcNs = "http://purl.org/dc/elements/1.1/";

using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using CtxtPtr = std::unique_ptr<xmlParserCtxt, decltype(&xmlFreeParserCtxt)>;

std::string nsOf(xmlNodePtr node) {
    if (!node->ns || !node->ns->href) return "";
    return reinterpret_cast<const char*>(node->ns->href);
}

// Element in the dialect's own vocabulary: `home` namespace or none at all.
bool isHome(xmlNodePtr node, const std::string& home, const char* name) {
    if (node->type != XML_ELEMENT_NODE) return false;
    if (xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) != 0) return false;
    std::string ns = nsOf(node);
    return ns.empty() || ns == home;
}

bool isIn(xmlNodePtr node, const char* ns, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0 &&
           nsOf(node) == ns;
}

std::string nodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return result;
}

std::string attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

std::string nsAttribute(xmlNodePtr node, const char* name, const char* ns) {
    xmlChar* value = xmlGetNsProp(node, reinterpret_cast<const xmlChar*>(name),
                                  reinterpret_cast<const xmlChar*>(ns));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

// Serialized children, for Atom type="xhtml" bodies.
std::string innerMarkup(xmlDocPtr doc, xmlNodePtr node) {
    xmlBufferPtr buffer = xmlBufferCreate();
    if (!buffer) return nodeText(node);
    for (xmlNodePtr child = node->children; child; child = child->next) {
        xmlNodeDump(buffer, doc, child, 0, 0);
    }
    const xmlChar* content = xmlBufferContent(buffer);
    std::string result = content ? reinterpret_cast<const char*>(content) : "";
    xmlBufferFree(buffer);
    return result;
}

std::string cleanTitle(const std::string& raw) {
    return StringUtils::collapseWhitespace(HtmlParser::htmlToText(raw));
}

// Fields collected from one entry element before they become a RawArticle.
struct EntryFields {
    std::string guid;
    std::string link;
    std::string title;
    std::string date;
    std::string fullContent;
    std::string summary;
};

class DocumentReader {
public:
    DocumentReader(xmlDocPtr doc, Timestamp fetchedAt) : doc_(doc), fetchedAt_(fetchedAt) {}

    ParsedFeed read(FeedDialect dialect, xmlNodePtr root) {
        ParsedFeed feed;
        feed.dialect = dialect;
        switch (dialect) {
            case FeedDialect::Rss2: readRss(root, feed); break;
            case FeedDialect::Atom: readAtom(root, feed); break;
            case FeedDialect::Rdf: readRdf(root, feed); break;
        }
        return feed;
    }

private:
    void readRss(xmlNodePtr root, ParsedFeed& feed) {
        const std::string home;
        for (xmlNodePtr channel = root->children; channel; channel = channel->next) {
            if (!isHome(channel, home, "channel")) continue;
            for (xmlNodePtr child = channel->children; child; child = child->next) {
                if (isHome(child, home, "title") && feed.title.empty()) {
                    feed.title = cleanTitle(nodeText(child));
                } else if (isHome(child, home, "item")) {
                    addEntry(feed, readRssItem(child, home));
                }
            }
        }
    }

    void readRdf(xmlNodePtr root, ParsedFeed& feed) {
        const std::string home = kRss1Ns;
        for (xmlNodePtr child = root->children; child; child = child->next) {
            if (isHome(child, home, "channel") && feed.title.empty()) {
                for (xmlNodePtr c = child->children; c; c = c->next) {
                    if (isHome(c, home, "title")) {
                        feed.title = cleanTitle(nodeText(c));
                        break;
                    }
                }
            } else if (isHome(child, home, "item")) {
                EntryFields fields = readRssItem(child, home);
                fields.guid = StringUtils::trim(nsAttribute(child, "about", kRdfNs));
                addEntry(feed, fields);
            }
        }
    }

    // RSS 2.0 and RSS 1.0 items share their element names.
    EntryFields readRssItem(xmlNodePtr item, const std::string& home) {
        EntryFields fields;
        std::string dcDate;
        for (xmlNodePtr child = item->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) continue;
            if (isHome(child, home, "guid")) {
                fields.guid = StringUtils::trim(nodeText(child));
            } else if (isHome(child, home, "link")) {
                fields.link = StringUtils::trim(nodeText(child));
            } else if (isHome(child, home, "title")) {
                fields.title = nodeText(child);
            } else if (isHome(child, home, "pubDate")) {
                fields.date = nodeText(child);
            } else if (isIn(child, kDcNs, "date")) {
                dcDate = nodeText(child);
            } else if (isHome(child, home, "description")) {
                fields.summary = nodeText(child);
            } else if (isIn(child, kContentNs, "encoded")) {
                fields.fullContent = nodeText(child);
            }
        }
        if (StringUtils::trim(fields.date).empty()) fields.date = dcDate;
        return fields;
    }

    void readAtom(xmlNodePtr root, ParsedFeed& feed) {
        // Atom 1.0, or 0.3 under its own namespace.
        const std::string home = nsOf(root).empty() ? kAtomNs : nsOf(root);
        for (xmlNodePtr child = root->children; child; child = child->next) {
            if (isHome(child, home, "title") && feed.title.empty()) {
                feed.title = cleanTitle(atomText(child));
            } else if (isHome(child, home, "entry")) {
                addEntry(feed, readAtomEntry(child, home));
            }
        }
    }

    EntryFields readAtomEntry(xmlNodePtr entry, const std::string& home) {
        EntryFields fields;
        std::string published, updated, fallbackLink;
        for (xmlNodePtr child = entry->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) continue;
            if (isHome(child, home, "id")) {
                fields.guid = StringUtils::trim(nodeText(child));
            } else if (isHome(child, home, "title")) {
                fields.title = atomText(child);
            } else if (isHome(child, home, "link")) {
                std::string rel = attribute(child, "rel");
                std::string href = StringUtils::trim(attribute(child, "href"));
                if ((rel.empty() || rel == "alternate") && fields.link.empty()) {
                    fields.link = href;
                } else if (fallbackLink.empty() && rel != "self" && rel != "edit") {
                    fallbackLink = href;
                }
            } else if (isHome(child, home, "published") || isHome(child, home, "issued")) {
                published = nodeText(child);
            } else if (isHome(child, home, "updated") || isHome(child, home, "modified")) {
                updated = nodeText(child);
            } else if (isHome(child, home, "content")) {
                fields.fullContent = atomText(child);
            } else if (isHome(child, home, "summary")) {
                fields.summary = atomText(child);
            }
        }
        if (fields.link.empty()) fields.link = fallbackLink;
        fields.date = StringUtils::trim(published).empty() ? updated : published;
        return fields;
    }

    // Atom text constructs carry markup either escaped (type="html") or inline (type="xhtml").
    std::string atomText(xmlNodePtr node) {
        if (attribute(node, "type") == "xhtml") return innerMarkup(doc_, node);
        return nodeText(node);
    }

    void addEntry(ParsedFeed& feed, const EntryFields& fields) {
        RawArticle article;
        article.guid = fields.guid;
        article.link = fields.link;
        article.title = cleanTitle(fields.title);

        if (article.guid.empty() && article.link.empty() && article.title.empty()) {
            feed.skippedEntries++;
            LOG_D("Parser", "Skipping entry without guid, link or title");
            return;
        }
        if (article.title.empty()) article.title = "Untitled";

        const std::string& body = StringUtils::trim(fields.fullContent).empty() ? fields.summary
                                                                                 : fields.fullContent;
        article.content = HtmlParser::htmlToText(body);

        if (auto published = DateParser::parse(fields.date)) {
            article.publishedAt = *published;
            article.publishedKnown = true;
        } else {
            if (!StringUtils::trim(fields.date).empty()) {
                LOG_D("Parser", "Unparseable date '{}', using fetch time", fields.date);
            }
            article.publishedAt = fetchedAt_;
            article.publishedKnown = false;
        }

        feed.articles.push_back(std::move(article));
    }

    xmlDocPtr doc_;
    Timestamp fetchedAt_;
};

}

const char* dialectName(FeedDialect dialect) {
    switch (dialect) {
        case FeedDialect::Rss2: return "RSS 2.0";
        case FeedDialect::Atom: return "Atom";
        case FeedDialect::Rdf: return "RDF";
    }
    return "unknown";
}

void FeedParser::globalInit() {
    static std::once_flag once;
    std::call_once(once, []() { xmlInitParser(); });
}

std::optional<FeedDialect> FeedParser::detectDialect(const std::string& rootName,
                                                     const std::string& rootNamespace) {
    if (rootName == "rss") return FeedDialect::Rss2;
    if (rootName == "feed") return FeedDialect::Atom;
    if (rootName == "RDF" && rootNamespace == kRdfNs) return FeedDialect::Rdf;
    return std::nullopt;
}

ParsedFeed FeedParser::parse(const std::string& document, Timestamp fetchedAt) {
    globalInit();

    if (StringUtils::trim(document).empty()) {
        throw ParseError(ErrorCode::MalformedDocument, "empty document");
    }

    CtxtPtr ctxt(xmlNewParserCtxt(), &xmlFreeParserCtxt);
    if (!ctxt) throw ParseError(ErrorCode::MalformedDocument, "cannot allocate parser");

    DocPtr doc(xmlCtxtReadMemory(ctxt.get(), document.data(), static_cast<int>(document.size()),
                                 nullptr, nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
               &xmlFreeDoc);
    if (!doc) {
        std::string detail = "not well-formed XML";
        const xmlError* err = xmlCtxtGetLastError(ctxt.get());
        if (err && err->message) {
            detail = StringUtils::trim(err->message);
            if (err->line > 0) detail += " (line " + std::to_string(err->line) + ")";
        }
        throw ParseError(ErrorCode::MalformedDocument, detail);
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) throw ParseError(ErrorCode::MalformedDocument, "document has no root element");

    std::string rootName = reinterpret_cast<const char*>(root->name);
    auto dialect = detectDialect(rootName, nsOf(root));
    if (!dialect) {
        throw ParseError(ErrorCode::UnsupportedDialect, "unsupported root element <" + rootName + ">");
    }

    DocumentReader reader(doc.get(), fetchedAt);
    ParsedFeed feed = reader.read(*dialect, root);
    LOG_D("Parser", "{} document '{}': {} entries, {} skipped", dialectName(feed.dialect), feed.title,
          feed.articles.size(), feed.skippedEntries);
    return feed;
}

}
