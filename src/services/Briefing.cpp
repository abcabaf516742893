#include "services/Briefing.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>

namespace ZenFeed {

std::string composeBriefingInput(const std::vector<Article>& articles, std::size_t snippetLength) {
    std::string out;
    for (const auto& article : articles) {
        std::string snippet = article.content.substr(0, std::min(snippetLength, article.content.size()));
        std::replace(snippet.begin(), snippet.end(), '\n', ' ');
        snippet = StringUtils::sanitizeUtf8(snippet);

        out += "Title: " + article.title + "\n";
        out += "Source: " + article.feedTitle + "\n";
        out += "Content: " + snippet + "\n";
        out += "---\n";
    }
    return out;
}

}
