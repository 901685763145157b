#include "recognition_engine.hpp"
#include "audio_utils.hpp"
#include "sentence_tokenizer.hpp"

#include <algorithm>
#include <cmath>
#include <sys/stat.h>

namespace readalong {

static const double DEFAULT_CHAPTER_SECONDS = 300.0;

static std::string Trim(const std::string &text) {
	size_t begin = text.find_first_not_of(" \t\r\n");
	if (begin == std::string::npos) {
		return "";
	}
	size_t end = text.find_last_not_of(" \t\r\n");
	return text.substr(begin, end - begin + 1);
}

std::vector<Sentence> SegmentFragments(const std::vector<TimedFragment> &fragments) {
	std::vector<Sentence> sentences;
	Sentence current;
	current.start = 0.0;
	current.end = 0.0;

	for (const auto &fragment : fragments) {
		// whisper can cut a multi-byte character at a segment edge
		std::string text = Trim(RepairUtf8(fragment.text));
		if (text.empty()) {
			continue;
		}
		double start = static_cast<double>(fragment.start_ms) / 1000.0;
		double end = static_cast<double>(fragment.end_ms) / 1000.0;

		if (current.text.empty()) {
			current.start = start;
		} else {
			current.text += ' ';
		}
		current.text += text;
		current.end = std::max(current.start, end);

		if (EndsWithTerminalPunctuation(text)) {
			sentences.push_back(current);
			current.text.clear();
		}
	}
	if (!current.text.empty()) {
		sentences.push_back(current);
	}
	return sentences;
}

ChapterTranscript CreateSyntheticTranscript(int64_t book_id, int32_t chapter_index, double duration,
                                            double sentence_seconds) {
	ChapterTranscript transcript;
	transcript.book_id = book_id;
	transcript.chapter_index = chapter_index;
	transcript.duration = duration;
	transcript.is_synthetic = true;

	if (duration <= 0.0 || sentence_seconds <= 0.0) {
		return transcript;
	}
	int64_t count = static_cast<int64_t>(std::floor(duration / sentence_seconds));
	if (count == 0) {
		// Shorter than one pseudo-sentence: cover the whole chapter
		Sentence sentence;
		sentence.text = "[Sentence 1 - transcription pending]";
		sentence.start = 0.0;
		sentence.end = duration;
		transcript.sentences.push_back(sentence);
		return transcript;
	}
	for (int64_t i = 0; i < count; i++) {
		Sentence sentence;
		sentence.text = "[Sentence " + std::to_string(i + 1) + " - transcription pending]";
		sentence.start = static_cast<double>(i) * sentence_seconds;
		sentence.end = static_cast<double>(i + 1) * sentence_seconds;
		transcript.sentences.push_back(sentence);
	}
	return transcript;
}

RecognitionEngine::RecognitionEngine(BackendSelector &selector, TranscriptStore &transcripts, ChapterCatalog &catalog)
    : selector_(selector), transcripts_(transcripts), catalog_(catalog), duration_probe_(AudioUtils::ProbeDuration) {
}

void RecognitionEngine::SetDurationProbe(DurationProbe probe) {
	duration_probe_ = std::move(probe);
}

double RecognitionEngine::FallbackDuration(const ChapterInfo &chapter, const ReadalongConfig &config) {
	if (chapter.duration_seconds > 0.0) {
		return chapter.duration_seconds;
	}
	double probed = 0.0;
	std::string probe_error;
	if (duration_probe_ && duration_probe_(chapter.file_path, probed, probe_error) && probed > 0.0) {
		return probed;
	}
	LogStatus(config, "Duration of " + chapter.file_path + " unknown, assuming " +
	                      std::to_string(static_cast<int>(DEFAULT_CHAPTER_SECONDS)) + "s");
	return DEFAULT_CHAPTER_SECONDS;
}

bool RecognitionEngine::TranscribeChapter(const ChapterInfo &chapter, const ReadalongConfig &config,
                                          ChapterTranscript &transcript, std::string &error) {
	struct stat buffer;
	if (stat(chapter.file_path.c_str(), &buffer) != 0) {
		error = "Audio file not found: " + chapter.file_path;
		return false;
	}

	auto engine = selector_.GetEngineContext(config.model, error);
	if (!engine) {
		return false;
	}

	EngineOptions options;
	options.language = config.language;
	options.threads = config.threads;

	LogStatus(config, "Running whisper on " + chapter.file_path);
	std::vector<TimedFragment> fragments;
	std::string engine_error;
	if (!engine->TranscribeFile(chapter.file_path, options, fragments, engine_error)) {
		LogStatus(config, "Whisper failed on " + chapter.file_path + " (" + engine_error +
		                      "), using synthetic transcript");
		transcript = CreateSyntheticTranscript(chapter.book_id, chapter.chapter_index,
		                                       FallbackDuration(chapter, config), config.synthetic_sentence_seconds);
		return true;
	}

	transcript = ChapterTranscript();
	transcript.book_id = chapter.book_id;
	transcript.chapter_index = chapter.chapter_index;
	transcript.is_synthetic = false;
	transcript.sentences = SegmentFragments(fragments);
	if (chapter.duration_seconds > 0.0) {
		transcript.duration = chapter.duration_seconds;
	} else {
		transcript.duration = transcript.sentences.empty() ? 0.0 : transcript.sentences.back().end;
	}
	LogStatus(config, "Chapter " + std::to_string(chapter.chapter_index) + ": " +
	                      std::to_string(fragments.size()) + " segments, " +
	                      std::to_string(transcript.sentences.size()) + " sentences");
	return true;
}

void RecognitionEngine::AppendChapter(const ChapterInfo &chapter, const ChapterTranscript &transcript, double &offset,
                                      BookTranscript &result) {
	result.chapter_indices.push_back(chapter.chapter_index);
	result.chapter_offsets.push_back(offset);

	for (const auto &sentence : transcript.sentences) {
		GlobalSentence global;
		global.text = sentence.text;
		global.start = sentence.start;
		global.end = sentence.end;
		global.chapter_index = chapter.chapter_index;
		global.global_start = offset + sentence.start;
		global.global_end = offset + sentence.end;
		global.is_synthetic = transcript.is_synthetic;
		result.sentences.push_back(global);
	}
	offset += chapter.duration_seconds > 0.0 ? chapter.duration_seconds : transcript.duration;
}

bool RecognitionEngine::TranscribeBook(int64_t book_id, const ReadalongConfig &config,
                                       const ProgressCallback &progress, BookTranscript &result, std::string &error) {
	std::vector<ChapterInfo> chapters;
	if (!catalog_.ListChapters(book_id, chapters, error)) {
		return false;
	}
	if (chapters.empty()) {
		error = "No chapters found for book " + std::to_string(book_id);
		return false;
	}

	result = BookTranscript();
	result.book_id = book_id;
	result.is_synthetic = true;
	double offset = 0.0;
	size_t total = chapters.size();

	for (size_t i = 0; i < total; i++) {
		const auto &chapter = chapters[i];
		if (progress) {
			int32_t percent = static_cast<int32_t>(std::lround(static_cast<double>(i) / total * 100.0));
			progress(percent, "Transcribing chapter " + std::to_string(i + 1) + " of " + std::to_string(total));
		}

		ChapterTranscript transcript;
		std::string lookup_error;
		if (transcripts_.FindChapterTranscript(book_id, chapter.chapter_index, transcript, lookup_error)) {
			LogStatus(config, "Using cached transcript for chapter " + std::to_string(chapter.chapter_index));
		} else if (!lookup_error.empty()) {
			error = lookup_error;
			return false;
		} else {
			if (!TranscribeChapter(chapter, config, transcript, error)) {
				return false;
			}
			if (!transcripts_.SaveChapterTranscript(transcript, error)) {
				return false;
			}
		}

		if (!transcript.is_synthetic) {
			result.is_synthetic = false;
		}
		AppendChapter(chapter, transcript, offset, result);
	}

	result.total_duration = offset;
	if (progress) {
		progress(100, "Transcription complete");
	}
	return true;
}

bool RecognitionEngine::LoadBookTranscript(int64_t book_id, BookTranscript &result, std::string &error) {
	std::vector<ChapterInfo> chapters;
	if (!catalog_.ListChapters(book_id, chapters, error)) {
		return false;
	}

	result = BookTranscript();
	result.book_id = book_id;
	result.is_synthetic = true;
	double offset = 0.0;
	bool found_any = false;

	for (const auto &chapter : chapters) {
		ChapterTranscript transcript;
		if (!transcripts_.FindChapterTranscript(book_id, chapter.chapter_index, transcript, error)) {
			if (!error.empty()) {
				return false;
			}
			// Untranscribed chapters still advance the clock when their length is known
			result.chapter_indices.push_back(chapter.chapter_index);
			result.chapter_offsets.push_back(offset);
			offset += std::max(0.0, chapter.duration_seconds);
			continue;
		}
		found_any = true;
		if (!transcript.is_synthetic) {
			result.is_synthetic = false;
		}
		AppendChapter(chapter, transcript, offset, result);
	}
	result.total_duration = offset;
	return found_any;
}

bool RecognitionEngine::InvalidateBook(int64_t book_id, int64_t &deleted, std::string &error) {
	return transcripts_.DeleteBookTranscripts(book_id, deleted, error);
}

} // namespace readalong
