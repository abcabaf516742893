#include "services/OpmlImporter.hpp"
#include "services/FeedParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <fstream>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>
#include <set>
#include <sstream>

namespace ZenFeed {

namespace {

std::string attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

bool isElement(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

class OutlineWalker {
public:
    explicit OutlineWalker(ImportBatch& batch) : batch_(batch) {}

    void walkChildren(xmlNodePtr parent, const std::string& category) {
        for (xmlNodePtr child = parent->children; child; child = child->next) {
            if (isElement(child, "outline")) visit(child, category);
        }
    }

private:
    void visit(xmlNodePtr node, const std::string& category) {
        std::string label = StringUtils::trim(attribute(node, "text"));
        if (label.empty()) label = StringUtils::trim(attribute(node, "title"));

        std::string url = StringUtils::trim(attribute(node, "xmlUrl"));
        if (!url.empty()) {
            add(FeedSpec{url, category, label});
            return;
        }
        walkChildren(node, label.empty() ? category : label);
    }

    void add(const FeedSpec& spec) {
        std::string key = StringUtils::normalizeFeedUrl(spec.url);
        if (key.empty()) key = spec.url;
        if (seen_.insert(key).second) {
            batch_.feeds.push_back(spec);
        } else {
            batch_.duplicates.push_back(spec);
        }
    }

    ImportBatch& batch_;
    std::set<std::string> seen_;
};

}

ImportBatch OpmlImporter::fromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw ParseError(ErrorCode::MalformedDocument, "cannot read " + path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromMemory(buffer.str());
}

ImportBatch OpmlImporter::fromMemory(const std::string& document) {
    FeedParser::globalInit();

    std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(
        xmlReadMemory(document.data(), static_cast<int>(document.size()), nullptr, nullptr,
                      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
        &xmlFreeDoc);
    if (!doc) throw ParseError(ErrorCode::MalformedDocument, "OPML is not well-formed XML");

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) throw ParseError(ErrorCode::MalformedDocument, "OPML has no root element");

    xmlNodePtr body = nullptr;
    for (xmlNodePtr child = root->children; child; child = child->next) {
        if (isElement(child, "body")) {
            body = child;
            break;
        }
    }

    ImportBatch batch;
    OutlineWalker walker(batch);
    walker.walkChildren(body ? body : root, "");

    LOG_I("Import", "OPML lists {} feeds ({} repeated)", batch.feeds.size(), batch.duplicates.size());
    return batch;
}

}
