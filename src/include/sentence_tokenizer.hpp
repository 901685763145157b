#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace readalong {

// True when text ends in . ! or ? optionally followed by one closing quote or bracket
bool EndsWithTerminalPunctuation(const std::string &text);

// Trim and collapse every whitespace run to a single space
std::string CollapseWhitespace(const std::string &text);

// Replace each byte that does not start a well-formed UTF-8 sequence with U+FFFD
std::string RepairUtf8(const std::string &text);

class SentenceTokenizer {
public:
	SentenceTokenizer();

	// Split whitespace-normalized text into sentences
	std::vector<std::string> Tokenize(const std::string &text) const;

private:
	// Whether words[index] closes the sentence that began at words[first]
	bool EndsSentence(const std::vector<std::string> &words, size_t index, size_t first) const;

	std::unordered_set<std::string> abbreviations_;
};

} // namespace readalong
