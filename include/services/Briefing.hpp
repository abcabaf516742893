#pragma once
#include "core/Types.hpp"
#include <string>
#include <vector>

namespace ZenFeed {

// Plain-text digest handed to an external summarizer: one
// "Title/Source/Content" block per article, each closed by "---".
// Content is flattened to one line and cut to snippetLength bytes
// (never inside a UTF-8 sequence).
std::string composeBriefingInput(const std::vector<Article>& articles, std::size_t snippetLength = 500);

}
