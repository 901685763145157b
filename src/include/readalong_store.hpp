#pragma once

#include "readalong_types.hpp"
#include <string>
#include <vector>

namespace readalong {

// Lookup methods named Find* return true when the row exists. They return false
// with an empty error when it does not, and false with error set on failure.

class JobStore {
public:
	virtual ~JobStore() {
	}

	// Insert a pending job; fills in id and timestamps
	virtual bool CreateJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) = 0;
	virtual bool FindJob(int64_t job_id, TranscriptionJob &job, std::string &error) = 0;
	// Newest non-terminal job for the subject
	virtual bool FindActiveJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) = 0;
	// Newest job for the subject, whatever its state
	virtual bool FindLatestJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) = 0;
	// progress < 0 keeps the stored progress; empty messages keep the stored ones
	virtual bool UpdateJob(int64_t job_id, JobStatus status, int32_t progress, const std::string &status_message,
	                       const std::string &error_message, std::string &error) = 0;
	// Back to pending with progress 0 and messages cleared
	virtual bool ResetJob(int64_t job_id, std::string &error) = 0;
	// Every non-terminal job, oldest first
	virtual bool ListUnfinishedJobs(std::vector<TranscriptionJob> &jobs, std::string &error) = 0;
};

class TranscriptStore {
public:
	virtual ~TranscriptStore() {
	}

	virtual bool FindChapterTranscript(int64_t book_id, int32_t chapter_index, ChapterTranscript &transcript,
	                                   std::string &error) = 0;
	// Cached transcripts are immutable; saving an existing key is an error
	virtual bool SaveChapterTranscript(const ChapterTranscript &transcript, std::string &error) = 0;
	virtual bool DeleteBookTranscripts(int64_t book_id, int64_t &deleted, std::string &error) = 0;
};

class AlignmentStore {
public:
	virtual ~AlignmentStore() {
	}

	// Atomically replaces any previous alignment of the document
	virtual bool ReplaceAlignment(const AlignmentResult &alignment, std::string &error) = 0;
	virtual bool FindAlignment(int64_t document_id, AlignmentResult &alignment, std::string &error) = 0;
};

class ChapterCatalog {
public:
	virtual ~ChapterCatalog() {
	}

	// Chapters of a book ordered by chapter index
	virtual bool ListChapters(int64_t book_id, std::vector<ChapterInfo> &chapters, std::string &error) = 0;
	virtual bool FindDocument(int64_t document_id, DocumentInfo &document, std::string &error) = 0;
	virtual bool UpdateDocument(int64_t document_id, int32_t page_count, bool is_scanned, std::string &error) = 0;
};

class SettingsStore {
public:
	virtual ~SettingsStore() {
	}

	virtual bool FindSetting(const std::string &key, std::string &value, std::string &error) = 0;
	virtual bool PutSetting(const std::string &key, const std::string &value, std::string &error) = 0;
};

} // namespace readalong
