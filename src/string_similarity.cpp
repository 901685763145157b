#include "string_similarity.hpp"

#include <algorithm>
#include <vector>

namespace readalong {

static const double WINKLER_BOOST_THRESHOLD = 0.7;
static const double WINKLER_PREFIX_SCALE = 0.1;
static const size_t WINKLER_MAX_PREFIX = 4;

double JaroSimilarity(const std::string &a, const std::string &b) {
	if (a.empty() && b.empty()) {
		return 1.0;
	}
	if (a.empty() || b.empty()) {
		return 0.0;
	}
	if (a == b) {
		return 1.0;
	}

	size_t window = std::max(a.size(), b.size()) / 2;
	window = window > 0 ? window - 1 : 0;

	std::vector<bool> a_matched(a.size(), false);
	std::vector<bool> b_matched(b.size(), false);
	size_t matches = 0;

	for (size_t i = 0; i < a.size(); i++) {
		size_t lo = i > window ? i - window : 0;
		size_t hi = std::min(i + window + 1, b.size());
		for (size_t j = lo; j < hi; j++) {
			if (!b_matched[j] && a[i] == b[j]) {
				a_matched[i] = true;
				b_matched[j] = true;
				matches++;
				break;
			}
		}
	}
	if (matches == 0) {
		return 0.0;
	}

	// Half the number of matched characters that appear in a different order
	size_t transpositions = 0;
	size_t k = 0;
	for (size_t i = 0; i < a.size(); i++) {
		if (!a_matched[i]) {
			continue;
		}
		while (!b_matched[k]) {
			k++;
		}
		if (a[i] != b[k]) {
			transpositions++;
		}
		k++;
	}

	double m = static_cast<double>(matches);
	double t = static_cast<double>(transpositions) / 2.0;
	return (m / a.size() + m / b.size() + (m - t) / m) / 3.0;
}

double JaroWinklerSimilarity(const std::string &a, const std::string &b) {
	double jaro = JaroSimilarity(a, b);
	if (jaro <= WINKLER_BOOST_THRESHOLD) {
		return jaro;
	}
	size_t limit = std::min(std::min(a.size(), b.size()), WINKLER_MAX_PREFIX);
	size_t prefix = 0;
	while (prefix < limit && a[prefix] == b[prefix]) {
		prefix++;
	}
	return jaro + prefix * WINKLER_PREFIX_SCALE * (1.0 - jaro);
}

} // namespace readalong
