#pragma once

#include "alignment_engine.hpp"
#include "readalong_config.hpp"
#include "readalong_store.hpp"
#include "recognition_engine.hpp"
#include "text_extractor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace readalong {

class CancellationToken {
public:
	CancellationToken() : cancelled_(false) {
	}
	void Cancel() {
		cancelled_ = true;
	}
	bool IsCancelled() const {
		return cancelled_;
	}

private:
	std::atomic<bool> cancelled_;
};

enum class CancelOutcome : uint8_t {
	CANCELLED,       // job was queued and is now cancelled
	REQUESTED,       // job is running; it stops at the next stage boundary
	NOT_CANCELLABLE, // job already finished or is committing its result
	NOT_FOUND
};

std::string CancelOutcomeToString(CancelOutcome outcome);

// Single-worker persisted job queue: extract, transcribe, align
class JobOrchestrator {
public:
	JobOrchestrator(JobStore &jobs, ChapterCatalog &catalog, AlignmentStore &alignments,
	                RecognitionEngine &recognition, TextExtractor &extractor);
	~JobOrchestrator();

	// Launch the worker thread. The thread keeps owner alive until it exits.
	void Start(std::shared_ptr<void> owner = nullptr);
	// Interrupt the running job at its next stage boundary, leaving it unfinished, and
	// wake the worker so it exits
	void RequestStop();
	// RequestStop, then wait for the worker
	void Stop();
	bool IsStopping() const;

	// Settings used by jobs that start after the call
	void UpdateConfig(const ReadalongConfig &config);
	ReadalongConfig GetConfig() const;

	// Return the active job of the subject, or create and enqueue a new one
	bool StartJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error);

	// Append to the queue unless the job is already queued or running
	void Enqueue(const TranscriptionJob &job);

	bool Cancel(int64_t job_id, CancelOutcome &outcome, std::string &error);

	// Run the next queued job on the calling thread; false when the queue is empty
	bool ProcessNext();

	// Re-enqueue every unfinished job, oldest first, reset to pending
	bool ResumePendingJobs(size_t &resumed, std::string &error);

	// Block until nothing is queued or running
	bool WaitUntilIdle(int64_t timeout_ms);

	size_t QueueSize() const;
	int64_t RunningJobId() const;

private:
	struct QueuedJob {
		int64_t job_id;
		JobKind kind;
		int64_t subject_id;
		std::shared_ptr<CancellationToken> token;
	};

	enum class JobOutcome : uint8_t { COMPLETED, CANCELLED };

	void WorkerLoop();
	void RunJob(const QueuedJob &job);
	JobOutcome RunBookJob(const QueuedJob &job, const ReadalongConfig &config);
	JobOutcome RunDocumentJob(const QueuedJob &job, const ReadalongConfig &config);

	void SetStatus(int64_t job_id, JobStatus status, int32_t progress, const std::string &message);
	void MarkCancelled(int64_t job_id, const ReadalongConfig &config);
	void MarkFailed(int64_t job_id, const std::string &reason, const ReadalongConfig &config);
	// Final cancellation check; after it succeeds the job can no longer be cancelled
	bool BeginCommit(const QueuedJob &job);
	bool IsQueuedOrRunning(int64_t job_id) const;
	// Caller holds mutex_; false when the job is already queued or running
	bool EnqueueLocked(const TranscriptionJob &job);

	JobStore &jobs_;
	ChapterCatalog &catalog_;
	AlignmentStore &alignments_;
	RecognitionEngine &recognition_;
	TextExtractor &extractor_;

	mutable std::mutex config_mutex_;
	ReadalongConfig config_;

	std::mutex start_mutex_;

	mutable std::mutex mutex_;
	std::condition_variable work_cv_;
	std::condition_variable idle_cv_;
	std::deque<QueuedJob> queue_;
	int64_t running_job_id_;
	std::shared_ptr<CancellationToken> running_token_;
	bool committing_;
	bool stopping_;
	std::thread worker_;
};

} // namespace readalong
