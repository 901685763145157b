#pragma once

#include <string>

namespace readalong {

// Jaro similarity over bytes, in [0, 1]
double JaroSimilarity(const std::string &a, const std::string &b);

// Jaro-Winkler similarity: Jaro boosted by up to 4 characters of common prefix (scale 0.1)
// once the Jaro score exceeds 0.7
double JaroWinklerSimilarity(const std::string &a, const std::string &b);

} // namespace readalong
