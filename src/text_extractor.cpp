#include "text_extractor.hpp"

#include "fpdfview.h"
#include "fpdf_text.h"

#include <mutex>

namespace readalong {

ExtractedDocument TextExtractor::Segment(const std::vector<RawPage> &pages, int min_chars) const {
	ExtractedDocument document;
	document.page_count = static_cast<int32_t>(pages.size());

	int64_t char_count = 0;
	for (size_t i = 0; i < pages.size(); i++) {
		DocumentPage page;
		page.page_number = static_cast<int32_t>(i + 1);
		page.width = pages[i].width;
		page.height = pages[i].height;
		page.text = CollapseWhitespace(pages[i].text);
		for (char c : page.text) {
			if (c != ' ') {
				char_count++;
			}
		}
		document.pages.push_back(page);
	}

	document.has_text = char_count >= min_chars;
	if (!document.has_text) {
		return document;
	}

	for (auto &page : document.pages) {
		auto sentences = tokenizer_.Tokenize(page.text);
		for (size_t i = 0; i < sentences.size(); i++) {
			DocumentSentence sentence;
			sentence.page_number = page.page_number;
			sentence.index_in_page = static_cast<int32_t>(i);
			sentence.text = sentences[i];
			page.sentences.push_back(sentence);
		}
	}
	return document;
}

bool TextExtractor::Extract(const std::string &path, int min_chars, ExtractedDocument &document, std::string &error) {
	std::vector<RawPage> pages;
	if (!ReadPages(path, pages, error)) {
		return false;
	}
	document = Segment(pages, min_chars);
	return true;
}

// pdfium keeps global state and is not thread-safe
static std::mutex g_pdfium_mutex;

static void EnsurePdfiumInitialized() {
	static bool initialized = false;
	if (!initialized) {
		FPDF_InitLibrary();
		initialized = true;
	}
}

static std::string PdfiumErrorString(unsigned long code) {
	switch (code) {
	case FPDF_ERR_FILE:
		return "file not found or could not be opened";
	case FPDF_ERR_FORMAT:
		return "file is not a PDF or is corrupted";
	case FPDF_ERR_PASSWORD:
		return "document is password protected";
	case FPDF_ERR_SECURITY:
		return "unsupported security scheme";
	default:
		return "unknown error " + std::to_string(code);
	}
}

static void AppendUtf8(std::string &out, unsigned int codepoint) {
	if (codepoint < 0x80) {
		out += static_cast<char>(codepoint);
	} else if (codepoint < 0x800) {
		out += static_cast<char>(0xC0 | (codepoint >> 6));
		out += static_cast<char>(0x80 | (codepoint & 0x3F));
	} else if (codepoint < 0x10000) {
		out += static_cast<char>(0xE0 | (codepoint >> 12));
		out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (codepoint & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (codepoint >> 18));
		out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (codepoint & 0x3F));
	}
}

// FPDFText_GetUnicode returns UTF-16 code units
static std::string ReadPageText(FPDF_TEXTPAGE text_page) {
	std::string text;
	int char_count = FPDFText_CountChars(text_page);
	for (int i = 0; i < char_count; i++) {
		unsigned int unit = FPDFText_GetUnicode(text_page, i);
		unsigned int codepoint = unit;
		if (unit >= 0xD800 && unit <= 0xDBFF) {
			unsigned int low = i + 1 < char_count ? FPDFText_GetUnicode(text_page, i + 1) : 0;
			if (low >= 0xDC00 && low <= 0xDFFF) {
				codepoint = ((unit - 0xD800) << 10) + (low - 0xDC00) + 0x10000;
				i++;
			} else {
				codepoint = 0xFFFD;
			}
		} else if (unit >= 0xDC00 && unit <= 0xDFFF) {
			codepoint = 0xFFFD;
		} else if (unit == 0) {
			continue;
		}
		AppendUtf8(text, codepoint);
	}
	return text;
}

bool PdfTextExtractor::ReadPages(const std::string &path, std::vector<RawPage> &pages, std::string &error) {
	std::lock_guard<std::mutex> lock(g_pdfium_mutex);
	EnsurePdfiumInitialized();

	FPDF_DOCUMENT doc = FPDF_LoadDocument(path.c_str(), nullptr);
	if (!doc) {
		error = "Failed to load PDF " + path + ": " + PdfiumErrorString(FPDF_GetLastError());
		return false;
	}

	pages.clear();
	int page_count = FPDF_GetPageCount(doc);
	for (int page_idx = 0; page_idx < page_count; page_idx++) {
		FPDF_PAGE page = FPDF_LoadPage(doc, page_idx);
		if (!page) {
			FPDF_CloseDocument(doc);
			error = "Failed to load page " + std::to_string(page_idx + 1) + " of " + path;
			return false;
		}

		RawPage raw;
		raw.width = FPDF_GetPageWidthF(page);
		raw.height = FPDF_GetPageHeightF(page);

		FPDF_TEXTPAGE text_page = FPDFText_LoadPage(page);
		if (text_page) {
			raw.text = ReadPageText(text_page);
			FPDFText_ClosePage(text_page);
		}
		FPDF_ClosePage(page);
		pages.push_back(raw);
	}

	FPDF_CloseDocument(doc);
	return true;
}

} // namespace readalong
