#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace readalong {

enum class JobKind : uint8_t {
	BOOK,    // transcription only
	DOCUMENT // extract + transcribe + align
};

enum class JobStatus : uint8_t { PENDING, EXTRACTING, TRANSCRIBING, ALIGNING, COMPLETED, FAILED, CANCELLED };

std::string JobKindToString(JobKind kind);
bool JobKindFromString(const std::string &str, JobKind &kind);
std::string JobStatusToString(JobStatus status);
bool JobStatusFromString(const std::string &str, JobStatus &status);
bool IsTerminalStatus(JobStatus status);

struct TranscriptionJob {
	int64_t id;
	JobKind kind;
	int64_t subject_id; // book id for BOOK jobs, document id for DOCUMENT jobs
	JobStatus status;
	int32_t progress; // 0-100
	std::string status_message;
	std::string error_message;
	std::string created_at;
	std::string updated_at;

	TranscriptionJob()
	    : id(0), kind(JobKind::BOOK), subject_id(0), status(JobStatus::PENDING), progress(0) {
	}
};

// Raw engine output, chapter-relative
struct TimedFragment {
	std::string text;
	int64_t start_ms;
	int64_t end_ms;
};

struct Sentence {
	std::string text;
	double start; // seconds, chapter-relative
	double end;
};

struct ChapterTranscript {
	int64_t book_id;
	int32_t chapter_index;
	double duration; // seconds
	bool is_synthetic;
	std::vector<Sentence> sentences;

	ChapterTranscript() : book_id(0), chapter_index(0), duration(0.0), is_synthetic(false) {
	}
};

struct GlobalSentence {
	std::string text;
	double start;
	double end;
	int32_t chapter_index;
	double global_start; // start + cumulative duration of preceding chapters
	double global_end;
	bool is_synthetic;
};

struct BookTranscript {
	int64_t book_id;
	double total_duration;
	std::vector<GlobalSentence> sentences;
	// Parallel arrays, ascending by offset
	std::vector<int32_t> chapter_indices;
	std::vector<double> chapter_offsets;
	bool is_synthetic; // every chapter is a placeholder

	BookTranscript() : book_id(0), total_duration(0.0), is_synthetic(false) {
	}

	// Chapter whose global range contains global_time
	int32_t ChapterAt(double global_time) const;
};

// Supplied by the library catalog
struct ChapterInfo {
	int64_t book_id;
	int32_t chapter_index;
	std::string file_path;
	double duration_seconds; // <= 0 when unknown
};

struct DocumentInfo {
	int64_t document_id;
	int64_t book_id;
	std::string file_path;
};

struct DocumentSentence {
	int32_t page_number;
	int32_t index_in_page;
	std::string text;
};

struct DocumentPage {
	int32_t page_number;
	double width;  // points, 0 when unknown
	double height; // points, 0 when unknown
	std::string text;
	std::vector<DocumentSentence> sentences;
};

struct ExtractedDocument {
	int32_t page_count;
	bool has_text;
	std::vector<DocumentPage> pages;

	ExtractedDocument() : page_count(0), has_text(false) {
	}

	size_t SentenceCount() const;
};

struct SentencePosition {
	double x;
	double y; // PDF user space, bottom-up
	double width;
	double height;
};

struct AudioSpan {
	int32_t chapter_index;
	double global_start;
	double global_end;
};

struct AlignmentRecord {
	std::string id; // p<page>s<index + 1>
	int32_t page_number;
	int32_t index_in_page;
	std::string text;
	SentencePosition position;
	bool has_audio;
	AudioSpan audio;
	double confidence;
	bool interpolated;
	int64_t transcript_index; // matched transcript sentence, -1 if none

	AlignmentRecord()
	    : page_number(0), index_in_page(0), position {0, 0, 0, 0}, has_audio(false), audio {0, 0, 0},
	      confidence(0.0), interpolated(false), transcript_index(-1) {
	}
};

struct AlignmentPage {
	int32_t page_number;
	std::vector<AlignmentRecord> sentences;
};

struct AlignmentResult {
	int64_t document_id;
	std::vector<AlignmentPage> pages;
	int64_t matched_count;
	int64_t interpolated_count;
	int64_t total_count;
	int64_t audio_sentence_count;
	double average_confidence;
	int32_t quality; // percent
	std::string alignment_type; // empty, or "time-based"

	AlignmentResult()
	    : document_id(0), matched_count(0), interpolated_count(0), total_count(0), audio_sentence_count(0),
	      average_confidence(0.0), quality(0) {
	}
};

} // namespace readalong
