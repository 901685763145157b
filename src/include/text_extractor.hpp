#pragma once

#include "readalong_types.hpp"
#include "sentence_tokenizer.hpp"

#include <string>
#include <vector>

namespace readalong {

struct RawPage {
	std::string text; // UTF-8
	double width;     // points
	double height;
};

class TextExtractor {
public:
	virtual ~TextExtractor() {
	}

	// Read the text of every page in order
	virtual bool ReadPages(const std::string &path, std::vector<RawPage> &pages, std::string &error) = 0;

	// Read pages, classify the document and segment text-bearing pages into sentences.
	// A document with fewer than min_chars non-space characters has has_text = false.
	bool Extract(const std::string &path, int min_chars, ExtractedDocument &document, std::string &error);

	// Build the document from already-read pages
	ExtractedDocument Segment(const std::vector<RawPage> &pages, int min_chars) const;

private:
	SentenceTokenizer tokenizer_;
};

// Reads text through pdfium
class PdfTextExtractor : public TextExtractor {
public:
	bool ReadPages(const std::string &path, std::vector<RawPage> &pages, std::string &error) override;
};

} // namespace readalong
