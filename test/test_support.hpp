#pragma once

#include "backend_selector.hpp"
#include "engine_context.hpp"
#include "readalong_store.hpp"
#include "text_extractor.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace readalong {
namespace testing {

// Path of a small file under the gtest temp directory
inline std::string MakeTempFile(const std::string &name, const std::string &contents = "audio") {
	std::string path = ::testing::TempDir() + name;
	std::ofstream out(path.c_str(), std::ios::binary);
	out << contents;
	return path;
}

inline bool FileExists(const std::string &path) {
	std::ifstream in(path.c_str());
	return in.good();
}

inline TimedFragment Fragment(const std::string &text, int64_t start_ms, int64_t end_ms) {
	TimedFragment fragment;
	fragment.text = text;
	fragment.start_ms = start_ms;
	fragment.end_ms = end_ms;
	return fragment;
}

// Shared between the fake engine instances built by one factory
struct FakeEngineState {
	std::map<std::string, std::vector<TimedFragment>> fragments; // by audio path
	bool fail_transcribe = false;
	bool fail_gpu_init = false;
	bool fail_cpu_init = false;
	int transcribe_calls = 0;
	int engines_created = 0;
	std::vector<std::string> init_backends;
	std::function<void(const std::string &)> on_transcribe;
};

class FakeEngine : public EngineHandle {
public:
	explicit FakeEngine(std::shared_ptr<FakeEngineState> state) : state_(std::move(state)) {
	}

	bool TranscribeFile(const std::string &audio_path, const EngineOptions &options,
	                    std::vector<TimedFragment> &fragments, std::string &error) override {
		state_->transcribe_calls++;
		if (state_->on_transcribe) {
			state_->on_transcribe(audio_path);
		}
		if (state_->fail_transcribe) {
			error = "decoder exploded";
			return false;
		}
		auto entry = state_->fragments.find(audio_path);
		fragments = entry != state_->fragments.end() ? entry->second : std::vector<TimedFragment>();
		return true;
	}

private:
	std::shared_ptr<FakeEngineState> state_;
};

inline EngineFactory FakeEngineFactory(std::shared_ptr<FakeEngineState> state) {
	return [state](const std::string &model_path, const BackendDescriptor &backend,
	               std::string &error) -> std::unique_ptr<EngineHandle> {
		state->init_backends.push_back(backend.name);
		if ((backend.gpu && state->fail_gpu_init) || (!backend.gpu && state->fail_cpu_init)) {
			error = "failed to initialize " + backend.name;
			return nullptr;
		}
		state->engines_created++;
		return std::unique_ptr<EngineHandle>(new FakeEngine(state));
	};
}

inline ModelResolver FakeModelResolver(bool succeed = true) {
	return [succeed](const std::string &model_name, std::string &model_path, std::string &error) {
		if (!succeed) {
			error = "download of " + model_name + " failed";
			return false;
		}
		model_path = "/models/ggml-" + model_name + ".bin";
		return true;
	};
}

class FakeProbe : public BackendProbe {
public:
	FakeProbe(std::string name, bool available) : name_(std::move(name)), available_(available) {
	}
	std::string Name() const override {
		return name_;
	}
	bool IsAvailable() const override {
		return available_;
	}

private:
	std::string name_;
	bool available_;
};

inline std::vector<std::shared_ptr<BackendProbe>> FakeProbes(bool cuda, bool vulkan) {
	std::vector<std::shared_ptr<BackendProbe>> probes;
	probes.push_back(std::make_shared<FakeProbe>("cuda", cuda));
	probes.push_back(std::make_shared<FakeProbe>("vulkan", vulkan));
	probes.push_back(std::make_shared<FakeProbe>("cpu", true));
	return probes;
}

inline PlatformInfo Platform(const std::string &os, const std::string &arch) {
	PlatformInfo platform;
	platform.os = os;
	platform.arch = arch;
	return platform;
}

// In-memory implementation of every store the pipeline uses
class MemoryStore : public JobStore, public TranscriptStore, public AlignmentStore, public ChapterCatalog {
public:
	// JobStore
	bool CreateJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			TranscriptionJob created;
			created.id = next_job_id_++;
			created.kind = kind;
			created.subject_id = subject_id;
			created.status = JobStatus::PENDING;
			jobs_.push_back(created);
			job = created;
		}
		if (on_create) {
			on_create(job.id);
		}
		return true;
	}

	bool FindJob(int64_t job_id, TranscriptionJob &job, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		for (const auto &stored : jobs_) {
			if (stored.id == job_id) {
				job = stored;
				return true;
			}
		}
		return false;
	}

	bool FindActiveJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		for (auto it = jobs_.rbegin(); it != jobs_.rend(); ++it) {
			if (it->kind == kind && it->subject_id == subject_id && !IsTerminalStatus(it->status)) {
				job = *it;
				return true;
			}
		}
		return false;
	}

	bool FindLatestJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		for (auto it = jobs_.rbegin(); it != jobs_.rend(); ++it) {
			if (it->kind == kind && it->subject_id == subject_id) {
				job = *it;
				return true;
			}
		}
		return false;
	}

	bool UpdateJob(int64_t job_id, JobStatus status, int32_t progress, const std::string &status_message,
	               const std::string &error_message, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		for (auto &stored : jobs_) {
			if (stored.id == job_id) {
				stored.status = status;
				if (progress >= 0) {
					stored.progress = progress;
				}
				if (!status_message.empty()) {
					stored.status_message = status_message;
				}
				if (!error_message.empty()) {
					stored.error_message = error_message;
				}
				history_.push_back(std::make_pair(job_id, status));
				progress_history_.push_back(stored.progress);
				return true;
			}
		}
		error = "no job " + std::to_string(job_id);
		return false;
	}

	bool ResetJob(int64_t job_id, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		for (auto &stored : jobs_) {
			if (stored.id == job_id) {
				stored.status = JobStatus::PENDING;
				stored.progress = 0;
				stored.status_message.clear();
				stored.error_message.clear();
				resets_++;
				return true;
			}
		}
		error = "no job " + std::to_string(job_id);
		return false;
	}

	bool ListUnfinishedJobs(std::vector<TranscriptionJob> &jobs, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		jobs.clear();
		for (const auto &stored : jobs_) {
			if (!IsTerminalStatus(stored.status)) {
				jobs.push_back(stored);
			}
		}
		return true;
	}

	// TranscriptStore
	bool FindChapterTranscript(int64_t book_id, int32_t chapter_index, ChapterTranscript &transcript,
	                           std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		auto entry = transcripts_.find(std::make_pair(book_id, chapter_index));
		if (entry == transcripts_.end()) {
			return false;
		}
		transcript = entry->second;
		return true;
	}

	bool SaveChapterTranscript(const ChapterTranscript &transcript, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		auto key = std::make_pair(transcript.book_id, transcript.chapter_index);
		if (transcripts_.count(key) > 0) {
			error = "transcript already stored";
			return false;
		}
		transcripts_[key] = transcript;
		return true;
	}

	bool DeleteBookTranscripts(int64_t book_id, int64_t &deleted, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		deleted = 0;
		for (auto it = transcripts_.begin(); it != transcripts_.end();) {
			if (it->first.first == book_id) {
				it = transcripts_.erase(it);
				deleted++;
			} else {
				++it;
			}
		}
		return true;
	}

	// AlignmentStore
	bool ReplaceAlignment(const AlignmentResult &alignment, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		alignments_[alignment.document_id] = alignment;
		return true;
	}

	bool FindAlignment(int64_t document_id, AlignmentResult &alignment, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		auto entry = alignments_.find(document_id);
		if (entry == alignments_.end()) {
			return false;
		}
		alignment = entry->second;
		return true;
	}

	// ChapterCatalog
	bool ListChapters(int64_t book_id, std::vector<ChapterInfo> &chapters, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		chapters.clear();
		for (const auto &chapter : chapters_) {
			if (chapter.book_id == book_id) {
				chapters.push_back(chapter);
			}
		}
		return true;
	}

	bool FindDocument(int64_t document_id, DocumentInfo &document, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		error.clear();
		auto entry = documents_.find(document_id);
		if (entry == documents_.end()) {
			return false;
		}
		document = entry->second;
		return true;
	}

	bool UpdateDocument(int64_t document_id, int32_t page_count, bool is_scanned, std::string &error) override {
		std::lock_guard<std::mutex> lock(mutex_);
		page_counts_[document_id] = page_count;
		scanned_[document_id] = is_scanned;
		return true;
	}

	// Fixture helpers
	void AddChapter(int64_t book_id, int32_t chapter_index, const std::string &file_path, double duration) {
		std::lock_guard<std::mutex> lock(mutex_);
		ChapterInfo chapter;
		chapter.book_id = book_id;
		chapter.chapter_index = chapter_index;
		chapter.file_path = file_path;
		chapter.duration_seconds = duration;
		chapters_.push_back(chapter);
	}

	void AddDocument(int64_t document_id, int64_t book_id, const std::string &file_path) {
		std::lock_guard<std::mutex> lock(mutex_);
		DocumentInfo document;
		document.document_id = document_id;
		document.book_id = book_id;
		document.file_path = file_path;
		documents_[document_id] = document;
	}

	// Simulates a row left behind by a previous process
	int64_t InsertJob(JobKind kind, int64_t subject_id, JobStatus status, int32_t progress) {
		std::lock_guard<std::mutex> lock(mutex_);
		TranscriptionJob job;
		job.id = next_job_id_++;
		job.kind = kind;
		job.subject_id = subject_id;
		job.status = status;
		job.progress = progress;
		jobs_.push_back(job);
		return job.id;
	}

	TranscriptionJob Job(int64_t job_id) {
		TranscriptionJob job;
		std::string error;
		FindJob(job_id, job, error);
		return job;
	}

	bool HasAlignment(int64_t document_id) {
		std::lock_guard<std::mutex> lock(mutex_);
		return alignments_.count(document_id) > 0;
	}

	std::vector<std::pair<int64_t, JobStatus>> StatusHistory() {
		std::lock_guard<std::mutex> lock(mutex_);
		return history_;
	}

	std::vector<int32_t> ProgressHistory() {
		std::lock_guard<std::mutex> lock(mutex_);
		return progress_history_;
	}

	int Resets() {
		std::lock_guard<std::mutex> lock(mutex_);
		return resets_;
	}

	bool IsScanned(int64_t document_id) {
		std::lock_guard<std::mutex> lock(mutex_);
		return scanned_[document_id];
	}

	int32_t PageCount(int64_t document_id) {
		std::lock_guard<std::mutex> lock(mutex_);
		return page_counts_[document_id];
	}

	// Runs after a job row is written, before CreateJob returns
	std::function<void(int64_t job_id)> on_create;

private:
	std::mutex mutex_;
	int64_t next_job_id_ = 1;
	std::vector<TranscriptionJob> jobs_;
	std::vector<std::pair<int64_t, JobStatus>> history_;
	std::vector<int32_t> progress_history_;
	int resets_ = 0;
	std::map<std::pair<int64_t, int32_t>, ChapterTranscript> transcripts_;
	std::map<int64_t, AlignmentResult> alignments_;
	std::vector<ChapterInfo> chapters_;
	std::map<int64_t, DocumentInfo> documents_;
	std::map<int64_t, int32_t> page_counts_;
	std::map<int64_t, bool> scanned_;
};

// Returns preset pages instead of reading a file
class FakeTextExtractor : public TextExtractor {
public:
	bool ReadPages(const std::string &path, std::vector<RawPage> &pages, std::string &error) override {
		if (!error_.empty()) {
			error = error_;
			return false;
		}
		pages = pages_;
		return true;
	}

	void AddPage(const std::string &text, double width = 612.0, double height = 792.0) {
		RawPage page;
		page.text = text;
		page.width = width;
		page.height = height;
		pages_.push_back(page);
	}

	void SetError(const std::string &error) {
		error_ = error;
	}

private:
	std::vector<RawPage> pages_;
	std::string error_;
};

} // namespace testing
} // namespace readalong
