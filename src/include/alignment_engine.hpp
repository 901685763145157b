#pragma once

#include "readalong_config.hpp"
#include "readalong_types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace readalong {

struct AlignmentOptions {
	double match_threshold;
	double synthetic_confidence;
	double interpolated_confidence;

	AlignmentOptions();
	static AlignmentOptions FromConfig(const ReadalongConfig &config);
};

class AlignmentEngine {
public:
	explicit AlignmentEngine(AlignmentOptions options);

	AlignmentResult Align(int64_t document_id, const ExtractedDocument &document,
	                      const BookTranscript &transcript) const;

	// Lowercase, drop punctuation, collapse whitespace
	static std::string NormalizeText(const std::string &text);

	// First three words of normalized text
	static std::string IndexKey(const std::string &normalized);

	// Estimated box of sentence index out of count on a page of the given size (0 = US Letter)
	static SentencePosition EstimatePosition(int32_t index, int32_t count, double page_width, double page_height);

	// Fill runs of unmatched sentences bracketed by matches on the same page
	static int64_t InterpolateTimestamps(std::vector<AlignmentPage> &pages, const BookTranscript &transcript,
	                                     double confidence);

private:
	typedef std::unordered_map<std::string, std::vector<size_t>> TranscriptIndex;

	AlignmentResult AlignTimeBased(int64_t document_id, const ExtractedDocument &document,
	                               const BookTranscript &transcript) const;
	AlignmentResult AlignFuzzy(int64_t document_id, const ExtractedDocument &document,
	                           const BookTranscript &transcript) const;
	bool FindBestMatch(const std::string &normalized, const std::vector<std::string> &normalized_transcript,
	                   const TranscriptIndex &index, const std::vector<bool> &consumed, size_t &match,
	                   double &score) const;
	static AlignmentRecord MakeRecord(const DocumentPage &page, const DocumentSentence &sentence);

	AlignmentOptions options_;
};

} // namespace readalong
