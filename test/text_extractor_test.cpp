#include "text_extractor.hpp"
#include "test_support.hpp"

#include "gtest/gtest.h"

namespace readalong {

using testing::FakeTextExtractor;

TEST(TextExtractorTest, SegmentsEveryPageIntoNumberedSentences) {
	FakeTextExtractor extractor;
	extractor.AddPage("First page opens here.  It continues\nonto a new line.", 595.0, 842.0);
	extractor.AddPage("");
	extractor.AddPage("Third page. Ends without a stop");

	ExtractedDocument document;
	std::string error;
	ASSERT_TRUE(extractor.Extract("book.pdf", 10, document, error)) << error;

	EXPECT_TRUE(document.has_text);
	EXPECT_EQ(document.page_count, 3);
	ASSERT_EQ(document.pages.size(), 3u);
	EXPECT_DOUBLE_EQ(document.pages[0].width, 595.0);

	const auto &first = document.pages[0].sentences;
	ASSERT_EQ(first.size(), 2u);
	EXPECT_EQ(first[1].text, "It continues onto a new line.");
	EXPECT_EQ(first[1].page_number, 1);
	EXPECT_EQ(first[1].index_in_page, 1);

	EXPECT_TRUE(document.pages[1].sentences.empty());

	const auto &third = document.pages[2].sentences;
	ASSERT_EQ(third.size(), 2u);
	EXPECT_EQ(third[0].page_number, 3);
	EXPECT_EQ(third[1].text, "Ends without a stop");
	EXPECT_EQ(document.SentenceCount(), 4u);
}

TEST(TextExtractorTest, SparseTextMeansScanned) {
	FakeTextExtractor extractor;
	extractor.AddPage("  12  ");
	extractor.AddPage(" iv ");

	ExtractedDocument document;
	std::string error;
	ASSERT_TRUE(extractor.Extract("scan.pdf", 100, document, error));
	EXPECT_FALSE(document.has_text);
	EXPECT_EQ(document.page_count, 2);
	EXPECT_EQ(document.SentenceCount(), 0u);
}

TEST(TextExtractorTest, ThresholdCountsNonSpaceCharacters) {
	FakeTextExtractor extractor;
	extractor.AddPage("a b c d e");

	ExtractedDocument document;
	std::string error;
	ASSERT_TRUE(extractor.Extract("tiny.pdf", 5, document, error));
	EXPECT_TRUE(document.has_text);
	ASSERT_TRUE(extractor.Extract("tiny.pdf", 6, document, error));
	EXPECT_FALSE(document.has_text);
}

TEST(TextExtractorTest, ReadErrorsPropagate) {
	FakeTextExtractor extractor;
	extractor.SetError("file is not a PDF or is corrupted");

	ExtractedDocument document;
	std::string error;
	EXPECT_FALSE(extractor.Extract("broken.pdf", 10, document, error));
	EXPECT_EQ(error, "file is not a PDF or is corrupted");
}

TEST(PdfTextExtractorTest, MissingFileIsAnError) {
	PdfTextExtractor extractor;
	std::vector<RawPage> pages;
	std::string error;
	EXPECT_FALSE(extractor.ReadPages("/nonexistent/document.pdf", pages, error));
	EXPECT_FALSE(error.empty());
}

} // namespace readalong
