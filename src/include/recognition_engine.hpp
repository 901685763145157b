#pragma once

#include "backend_selector.hpp"
#include "readalong_config.hpp"
#include "readalong_store.hpp"
#include "readalong_types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace readalong {

typedef std::function<void(int32_t percent, const std::string &message)> ProgressCallback;

// Probes the duration of an audio file in seconds
typedef std::function<bool(const std::string &file_path, double &duration, std::string &error)> DurationProbe;

// Accumulate trimmed fragments into sentences, closing one whenever a fragment ends in
// terminal punctuation. Trailing text is flushed as a final sentence.
std::vector<Sentence> SegmentFragments(const std::vector<TimedFragment> &fragments);

// Placeholder transcript: duration split into fixed-length pseudo-sentences
ChapterTranscript CreateSyntheticTranscript(int64_t book_id, int32_t chapter_index, double duration,
                                            double sentence_seconds);

class RecognitionEngine {
public:
	RecognitionEngine(BackendSelector &selector, TranscriptStore &transcripts, ChapterCatalog &catalog);

	void SetDurationProbe(DurationProbe probe);

	// Transcribe one chapter. Runtime engine failures degrade to a synthetic transcript;
	// false is returned only for fatal errors (missing audio, model or engine unavailable).
	bool TranscribeChapter(const ChapterInfo &chapter, const ReadalongConfig &config, ChapterTranscript &transcript,
	                       std::string &error);

	// Transcribe every chapter of a book in order, reusing cached chapters
	bool TranscribeBook(int64_t book_id, const ReadalongConfig &config, const ProgressCallback &progress,
	                    BookTranscript &result, std::string &error);

	// Assemble the book transcript from cached chapters only; never runs the engine.
	// Returns false with empty error when no chapter has been transcribed yet.
	bool LoadBookTranscript(int64_t book_id, BookTranscript &result, std::string &error);

	// Drop cached chapter transcripts of a book
	bool InvalidateBook(int64_t book_id, int64_t &deleted, std::string &error);

private:
	double FallbackDuration(const ChapterInfo &chapter, const ReadalongConfig &config);
	static void AppendChapter(const ChapterInfo &chapter, const ChapterTranscript &transcript, double &offset,
	                          BookTranscript &result);

	BackendSelector &selector_;
	TranscriptStore &transcripts_;
	ChapterCatalog &catalog_;
	DurationProbe duration_probe_;
};

} // namespace readalong
