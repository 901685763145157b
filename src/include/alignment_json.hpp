#pragma once

#include "readalong_types.hpp"
#include <string>

namespace readalong {

// Escape string for JSON
std::string EscapeJsonString(const std::string &str);

// {documentId, pages:[{pageNumber, sentences:[...]}], metadata:{...}, quality}
std::string RenderAlignmentJson(const AlignmentResult &alignment);

} // namespace readalong
