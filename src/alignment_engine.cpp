#include "alignment_engine.hpp"
#include "string_similarity.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace readalong {

// US Letter in points
static const double DEFAULT_PAGE_WIDTH = 612.0;
static const double DEFAULT_PAGE_HEIGHT = 792.0;
static const double PAGE_MARGIN = 72.0;
static const double LINE_HEIGHT = 14.0;

AlignmentOptions::AlignmentOptions()
    : match_threshold(ReadalongConfig::DEFAULT_MATCH_THRESHOLD),
      synthetic_confidence(ReadalongConfig::DEFAULT_SYNTHETIC_CONFIDENCE),
      interpolated_confidence(ReadalongConfig::DEFAULT_INTERPOLATED_CONFIDENCE) {
}

AlignmentOptions AlignmentOptions::FromConfig(const ReadalongConfig &config) {
	AlignmentOptions options;
	options.match_threshold = config.match_threshold;
	options.synthetic_confidence = config.synthetic_confidence;
	options.interpolated_confidence = config.interpolated_confidence;
	return options;
}

AlignmentEngine::AlignmentEngine(AlignmentOptions options) : options_(options) {
}

std::string AlignmentEngine::NormalizeText(const std::string &text) {
	std::string normalized;
	normalized.reserve(text.size());
	bool pending_space = false;
	for (char c : text) {
		unsigned char uc = static_cast<unsigned char>(c);
		if (std::isspace(uc)) {
			pending_space = !normalized.empty();
			continue;
		}
		// ASCII punctuation is dropped; multi-byte UTF-8 sequences are kept as word characters
		if (uc < 0x80 && !std::isalnum(uc) && c != '_') {
			continue;
		}
		if (pending_space) {
			normalized += ' ';
			pending_space = false;
		}
		normalized += uc < 0x80 ? static_cast<char>(std::tolower(uc)) : c;
	}
	return normalized;
}

std::string AlignmentEngine::IndexKey(const std::string &normalized) {
	size_t pos = 0;
	for (int words = 0; words < 3; words++) {
		pos = normalized.find(' ', pos);
		if (pos == std::string::npos) {
			return normalized;
		}
		if (words < 2) {
			pos++;
		}
	}
	return normalized.substr(0, pos);
}

SentencePosition AlignmentEngine::EstimatePosition(int32_t index, int32_t count, double page_width,
                                                   double page_height) {
	double width = page_width > 0 ? page_width : DEFAULT_PAGE_WIDTH;
	double height = page_height > 0 ? page_height : DEFAULT_PAGE_HEIGHT;
	double content_height = std::max(0.0, height - 2 * PAGE_MARGIN);
	double fraction = count > 0 ? static_cast<double>(index) / count : 0.0;
	double approx_y = PAGE_MARGIN + fraction * content_height;

	SentencePosition position;
	position.x = PAGE_MARGIN;
	// PDF user space grows upward
	position.y = std::round(height - approx_y);
	position.width = std::max(0.0, width - 2 * PAGE_MARGIN);
	position.height = LINE_HEIGHT;
	return position;
}

AlignmentRecord AlignmentEngine::MakeRecord(const DocumentPage &page, const DocumentSentence &sentence) {
	AlignmentRecord record;
	record.id = "p" + std::to_string(page.page_number) + "s" + std::to_string(sentence.index_in_page + 1);
	record.page_number = page.page_number;
	record.index_in_page = sentence.index_in_page;
	record.text = sentence.text;
	record.position = EstimatePosition(sentence.index_in_page, static_cast<int32_t>(page.sentences.size()), page.width,
	                                   page.height);
	return record;
}

AlignmentResult AlignmentEngine::Align(int64_t document_id, const ExtractedDocument &document,
                                       const BookTranscript &transcript) const {
	if (transcript.is_synthetic) {
		return AlignTimeBased(document_id, document, transcript);
	}
	return AlignFuzzy(document_id, document, transcript);
}

AlignmentResult AlignmentEngine::AlignTimeBased(int64_t document_id, const ExtractedDocument &document,
                                                const BookTranscript &transcript) const {
	AlignmentResult result;
	result.document_id = document_id;
	result.alignment_type = "time-based";
	result.total_count = static_cast<int64_t>(document.SentenceCount());
	result.audio_sentence_count = static_cast<int64_t>(transcript.sentences.size());

	double slice = result.total_count > 0 ? transcript.total_duration / result.total_count : 0.0;
	int64_t sentence_index = 0;

	for (const auto &page : document.pages) {
		AlignmentPage aligned;
		aligned.page_number = page.page_number;
		for (const auto &sentence : page.sentences) {
			AlignmentRecord record = MakeRecord(page, sentence);
			record.has_audio = true;
			record.audio.global_start = sentence_index * slice;
			record.audio.global_end = (sentence_index + 1) * slice;
			record.audio.chapter_index = transcript.ChapterAt(record.audio.global_start);
			record.confidence = options_.synthetic_confidence;
			aligned.sentences.push_back(record);
			sentence_index++;
		}
		result.pages.push_back(aligned);
	}

	result.matched_count = 0;
	result.quality = 0;
	result.average_confidence = result.total_count > 0 ? options_.synthetic_confidence : 0.0;
	return result;
}

bool AlignmentEngine::FindBestMatch(const std::string &normalized,
                                    const std::vector<std::string> &normalized_transcript,
                                    const TranscriptIndex &index, const std::vector<bool> &consumed, size_t &match,
                                    double &score) const {
	auto entry = index.find(IndexKey(normalized));
	if (entry == index.end()) {
		return false;
	}

	bool found = false;
	double best = 0.0;
	for (auto candidate : entry->second) {
		if (consumed[candidate]) {
			continue;
		}
		double similarity = JaroWinklerSimilarity(normalized, normalized_transcript[candidate]);
		if (similarity > best && similarity >= options_.match_threshold) {
			best = similarity;
			match = candidate;
			found = true;
		}
	}
	score = best;
	return found;
}

AlignmentResult AlignmentEngine::AlignFuzzy(int64_t document_id, const ExtractedDocument &document,
                                            const BookTranscript &transcript) const {
	AlignmentResult result;
	result.document_id = document_id;
	result.total_count = static_cast<int64_t>(document.SentenceCount());
	result.audio_sentence_count = static_cast<int64_t>(transcript.sentences.size());

	// Placeholder sentences of partially synthetic books are never match candidates
	std::vector<std::string> normalized_transcript(transcript.sentences.size());
	TranscriptIndex index;
	for (size_t i = 0; i < transcript.sentences.size(); i++) {
		if (transcript.sentences[i].is_synthetic) {
			continue;
		}
		normalized_transcript[i] = NormalizeText(transcript.sentences[i].text);
		index[IndexKey(normalized_transcript[i])].push_back(i);
	}

	std::vector<bool> consumed(transcript.sentences.size(), false);
	double confidence_sum = 0.0;

	for (const auto &page : document.pages) {
		AlignmentPage aligned;
		aligned.page_number = page.page_number;
		for (const auto &sentence : page.sentences) {
			AlignmentRecord record = MakeRecord(page, sentence);
			std::string normalized = NormalizeText(sentence.text);

			size_t match = 0;
			double score = 0.0;
			if (normalized.size() >= 3 &&
			    FindBestMatch(normalized, normalized_transcript, index, consumed, match, score)) {
				const auto &matched = transcript.sentences[match];
				consumed[match] = true;
				record.has_audio = true;
				record.audio.chapter_index = matched.chapter_index;
				record.audio.global_start = matched.global_start;
				record.audio.global_end = matched.global_end;
				record.confidence = score;
				record.transcript_index = static_cast<int64_t>(match);
				result.matched_count++;
				confidence_sum += score;
			}
			aligned.sentences.push_back(record);
		}
		result.pages.push_back(aligned);
	}

	result.interpolated_count = InterpolateTimestamps(result.pages, transcript, options_.interpolated_confidence);
	result.average_confidence = result.matched_count > 0 ? confidence_sum / result.matched_count : 0.0;
	if (result.total_count > 0) {
		long quality = std::lround(static_cast<double>(result.matched_count) / result.total_count * 100.0);
		result.quality = static_cast<int32_t>(std::min(100L, std::max(0L, quality)));
	}
	return result;
}

int64_t AlignmentEngine::InterpolateTimestamps(std::vector<AlignmentPage> &pages, const BookTranscript &transcript,
                                               double confidence) {
	int64_t filled = 0;
	for (auto &page : pages) {
		auto &sentences = page.sentences;
		std::vector<size_t> anchors;
		for (size_t i = 0; i < sentences.size(); i++) {
			if (sentences[i].has_audio) {
				anchors.push_back(i);
			}
		}

		for (size_t a = 0; a + 1 < anchors.size(); a++) {
			size_t first = anchors[a];
			size_t last = anchors[a + 1];
			size_t gap = last - first - 1;
			if (gap == 0) {
				continue;
			}
			double start = sentences[first].audio.global_end;
			double end = sentences[last].audio.global_start;
			double step = end > start ? (end - start) / gap : 0.0;

			for (size_t k = 0; k < gap; k++) {
				auto &record = sentences[first + 1 + k];
				record.has_audio = true;
				record.interpolated = true;
				record.audio.global_start = start + k * step;
				record.audio.global_end = start + (k + 1) * step;
				record.audio.chapter_index = transcript.ChapterAt(record.audio.global_start);
				record.confidence = confidence;
				filled++;
			}
		}
	}
	return filled;
}

} // namespace readalong
