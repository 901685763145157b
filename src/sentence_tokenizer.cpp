#include "sentence_tokenizer.hpp"

#include <cctype>
#include <sstream>

namespace readalong {

static const char *const ABBREVIATIONS[] = {
    "mr.", "mrs.", "ms.", "dr.", "prof.", "sr.", "jr.", "st.", "mt.", "vs.", "etc.", "e.g.", "i.e.", "cf.",
    "al.", "fig.", "no.", "vol.", "ch.", "pp.", "p.", "ed.", "inc.", "ltd.", "co.", "corp.", "gen.", "col.",
    "capt.", "lt.", "sgt.", "rev.", "hon.", "jan.", "feb.", "mar.", "apr.", "jun.", "jul.", "aug.", "sep.",
    "sept.", "oct.", "nov.", "dec.", "approx.", "dept.", "est."};

// UTF-8 right double and right single quotation marks
static const std::string RIGHT_DOUBLE_QUOTE = "\xE2\x80\x9D";
static const std::string RIGHT_SINGLE_QUOTE = "\xE2\x80\x99";

static bool EndsWith(const std::string &text, size_t end, const std::string &suffix) {
	return end >= suffix.size() && text.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}

static bool IsTerminal(char c) {
	return c == '.' || c == '!' || c == '?';
}

bool EndsWithTerminalPunctuation(const std::string &text) {
	size_t end = text.size();
	while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		end--;
	}
	if (end == 0) {
		return false;
	}
	if (IsTerminal(text[end - 1])) {
		return true;
	}

	// One closing quote or bracket
	char last = text[end - 1];
	if (last == '"' || last == '\'' || last == ')' || last == ']') {
		end--;
	} else if (EndsWith(text, end, RIGHT_DOUBLE_QUOTE) || EndsWith(text, end, RIGHT_SINGLE_QUOTE)) {
		end -= 3;
	} else {
		return false;
	}
	return end > 0 && IsTerminal(text[end - 1]);
}

std::string CollapseWhitespace(const std::string &text) {
	std::istringstream stream(text);
	std::string word;
	std::string result;
	while (stream >> word) {
		if (!result.empty()) {
			result += ' ';
		}
		result += word;
	}
	return result;
}

// Length of the well-formed UTF-8 sequence at text[pos], 0 when malformed
static size_t ValidSequenceLength(const std::string &text, size_t pos) {
	auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
	unsigned char lead = byte(pos);
	if (lead < 0x80) {
		return 1;
	}
	size_t length;
	unsigned char min_second = 0x80;
	unsigned char max_second = 0xBF;
	if (lead >= 0xC2 && lead <= 0xDF) {
		length = 2;
	} else if (lead >= 0xE0 && lead <= 0xEF) {
		length = 3;
		if (lead == 0xE0) {
			min_second = 0xA0;
		} else if (lead == 0xED) {
			// No UTF-16 surrogates
			max_second = 0x9F;
		}
	} else if (lead >= 0xF0 && lead <= 0xF4) {
		length = 4;
		if (lead == 0xF0) {
			min_second = 0x90;
		} else if (lead == 0xF4) {
			max_second = 0x8F;
		}
	} else {
		return 0;
	}
	if (pos + length > text.size()) {
		return 0;
	}
	if (byte(pos + 1) < min_second || byte(pos + 1) > max_second) {
		return 0;
	}
	for (size_t i = 2; i < length; i++) {
		if ((byte(pos + i) & 0xC0) != 0x80) {
			return 0;
		}
	}
	return length;
}

std::string RepairUtf8(const std::string &text) {
	static const std::string REPLACEMENT = "\xEF\xBF\xBD";
	std::string result;
	result.reserve(text.size());
	size_t pos = 0;
	while (pos < text.size()) {
		size_t length = ValidSequenceLength(text, pos);
		if (length == 0) {
			result += REPLACEMENT;
			pos++;
			continue;
		}
		result.append(text, pos, length);
		pos += length;
	}
	return result;
}

SentenceTokenizer::SentenceTokenizer() {
	for (auto abbreviation : ABBREVIATIONS) {
		abbreviations_.insert(abbreviation);
	}
}

static bool IsOpeningMark(char c) {
	return c == '(' || c == '"' || c == '\'';
}

// Word without leading quotes or brackets
static std::string StripOpening(const std::string &word) {
	size_t start = 0;
	while (start < word.size() && IsOpeningMark(word[start])) {
		start++;
	}
	return word.substr(start);
}

static bool StartsWithUpper(const std::string &word) {
	std::string bare = StripOpening(word);
	return !bare.empty() && std::isupper(static_cast<unsigned char>(bare[0]));
}

static bool IsInitial(const std::string &word) {
	std::string bare = StripOpening(word);
	return bare.size() == 2 && bare[1] == '.' && std::isupper(static_cast<unsigned char>(bare[0])) && bare[0] != 'I';
}

bool SentenceTokenizer::EndsSentence(const std::vector<std::string> &words, size_t index, size_t first) const {
	const std::string &word = words[index];
	if (!EndsWithTerminalPunctuation(word)) {
		return false;
	}
	if (word.back() != '.') {
		return true;
	}

	std::string lower;
	for (char c : StripOpening(word)) {
		lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	if (abbreviations_.count(lower) > 0) {
		return false;
	}
	if (lower.size() != 2 || !std::isalpha(static_cast<unsigned char>(lower[0]))) {
		return true;
	}

	// A single letter: "J. R. R. Tolkien" continues, "vitamin C. It helps." ends
	if (index + 1 >= words.size()) {
		return true;
	}
	if (!StartsWithUpper(words[index + 1])) {
		return false;
	}
	if (!IsInitial(word)) {
		return true;
	}
	if (IsInitial(words[index + 1]) || (index > first && IsInitial(words[index - 1]))) {
		return false;
	}
	if (index == first) {
		return false;
	}
	// Middle initial after a capitalized name, as in "met George W. Bush"
	return !(index - 1 > first && StartsWithUpper(words[index - 1]));
}

std::vector<std::string> SentenceTokenizer::Tokenize(const std::string &text) const {
	std::vector<std::string> words;
	std::istringstream stream(text);
	std::string word;
	while (stream >> word) {
		words.push_back(word);
	}

	std::vector<std::string> sentences;
	std::string current;
	size_t first = 0;
	for (size_t i = 0; i < words.size(); i++) {
		if (current.empty()) {
			first = i;
		} else {
			current += ' ';
		}
		current += words[i];
		if (EndsSentence(words, i, first)) {
			sentences.push_back(current);
			current.clear();
		}
	}
	if (!current.empty()) {
		sentences.push_back(current);
	}
	return sentences;
}

} // namespace readalong
