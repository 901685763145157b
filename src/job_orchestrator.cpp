#include "job_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace readalong {

static const char *const CANCELLED_MESSAGE = "Cancelled by user";
static const char *const SCANNED_MESSAGE = "Document appears to be scanned/image-based; OCR is not supported";

std::string CancelOutcomeToString(CancelOutcome outcome) {
	switch (outcome) {
	case CancelOutcome::CANCELLED:
		return "cancelled";
	case CancelOutcome::REQUESTED:
		return "cancellation requested";
	case CancelOutcome::NOT_CANCELLABLE:
		return "job already finished";
	case CancelOutcome::NOT_FOUND:
		return "job not found";
	}
	return "job not found";
}

static int32_t Scale(int32_t base, int32_t percent, double factor) {
	return base + static_cast<int32_t>(std::lround(percent * factor));
}

JobOrchestrator::JobOrchestrator(JobStore &jobs, ChapterCatalog &catalog, AlignmentStore &alignments,
                                 RecognitionEngine &recognition, TextExtractor &extractor)
    : jobs_(jobs), catalog_(catalog), alignments_(alignments), recognition_(recognition), extractor_(extractor),
      running_job_id_(0), committing_(false), stopping_(false) {
}

JobOrchestrator::~JobOrchestrator() {
	Stop();
}

void JobOrchestrator::Start(std::shared_ptr<void> owner) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (worker_.joinable()) {
		return;
	}
	stopping_ = false;
	// owner is released when the thread exits
	worker_ = std::thread([this, owner]() { WorkerLoop(); });
}

void JobOrchestrator::RequestStop() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
		// The running job stops at its next stage boundary and stays unfinished for resume
		if (running_token_ && !committing_) {
			running_token_->Cancel();
		}
	}
	work_cv_.notify_all();
}

void JobOrchestrator::Stop() {
	RequestStop();
	if (!worker_.joinable()) {
		return;
	}
	if (worker_.get_id() == std::this_thread::get_id()) {
		// The worker dropped the last reference to its owner; it exits right after
		worker_.detach();
	} else {
		worker_.join();
	}
}

void JobOrchestrator::UpdateConfig(const ReadalongConfig &config) {
	std::lock_guard<std::mutex> lock(config_mutex_);
	config_ = config;
}

ReadalongConfig JobOrchestrator::GetConfig() const {
	std::lock_guard<std::mutex> lock(config_mutex_);
	return config_;
}

void JobOrchestrator::WorkerLoop() {
	while (true) {
		{
			std::unique_lock<std::mutex> lock(mutex_);
			work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
			if (stopping_) {
				return;
			}
		}
		ProcessNext();
	}
}

bool JobOrchestrator::IsQueuedOrRunning(int64_t job_id) const {
	if (running_job_id_ == job_id) {
		return true;
	}
	for (const auto &queued : queue_) {
		if (queued.job_id == job_id) {
			return true;
		}
	}
	return false;
}

bool JobOrchestrator::EnqueueLocked(const TranscriptionJob &job) {
	if (IsQueuedOrRunning(job.id)) {
		return false;
	}
	QueuedJob queued;
	queued.job_id = job.id;
	queued.kind = job.kind;
	queued.subject_id = job.subject_id;
	queued.token = std::make_shared<CancellationToken>();
	queue_.push_back(queued);
	return true;
}

void JobOrchestrator::Enqueue(const TranscriptionJob &job) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!EnqueueLocked(job)) {
			return;
		}
	}
	work_cv_.notify_one();
}

bool JobOrchestrator::StartJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) {
	std::lock_guard<std::mutex> start_lock(start_mutex_);

	if (jobs_.FindActiveJob(kind, subject_id, job, error)) {
		return true;
	}
	if (!error.empty()) {
		return false;
	}

	if (kind == JobKind::DOCUMENT) {
		DocumentInfo document;
		if (!catalog_.FindDocument(subject_id, document, error)) {
			if (error.empty()) {
				error = "Document not found: " + std::to_string(subject_id);
			}
			return false;
		}
	} else {
		std::vector<ChapterInfo> chapters;
		if (!catalog_.ListChapters(subject_id, chapters, error)) {
			return false;
		}
		if (chapters.empty()) {
			error = "No chapters found for book " + std::to_string(subject_id);
			return false;
		}
	}

	{
		// Cancel cannot see the new row before it is queued
		std::lock_guard<std::mutex> lock(mutex_);
		if (!jobs_.CreateJob(kind, subject_id, job, error)) {
			return false;
		}
		EnqueueLocked(job);
	}
	work_cv_.notify_one();
	LogStatus(GetConfig(), "Queued " + JobKindToString(kind) + " job " + std::to_string(job.id) + " for subject " +
	                           std::to_string(subject_id));
	return true;
}

bool JobOrchestrator::Cancel(int64_t job_id, CancelOutcome &outcome, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	for (auto it = queue_.begin(); it != queue_.end(); ++it) {
		if (it->job_id == job_id) {
			queue_.erase(it);
			outcome = CancelOutcome::CANCELLED;
			return jobs_.UpdateJob(job_id, JobStatus::CANCELLED, -1, "", CANCELLED_MESSAGE, error);
		}
	}
	if (running_job_id_ == job_id) {
		if (committing_) {
			outcome = CancelOutcome::NOT_CANCELLABLE;
		} else {
			running_token_->Cancel();
			outcome = CancelOutcome::REQUESTED;
		}
		return true;
	}

	// Not known to this process: only an unfinished row left over in the store
	TranscriptionJob job;
	if (!jobs_.FindJob(job_id, job, error)) {
		if (!error.empty()) {
			return false;
		}
		outcome = CancelOutcome::NOT_FOUND;
		return true;
	}
	if (IsTerminalStatus(job.status)) {
		outcome = CancelOutcome::NOT_CANCELLABLE;
		return true;
	}
	outcome = CancelOutcome::CANCELLED;
	return jobs_.UpdateJob(job_id, JobStatus::CANCELLED, -1, "", CANCELLED_MESSAGE, error);
}

bool JobOrchestrator::ProcessNext() {
	QueuedJob job;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (queue_.empty()) {
			return false;
		}
		job = queue_.front();
		queue_.pop_front();
		running_job_id_ = job.job_id;
		running_token_ = job.token;
		committing_ = false;
	}

	RunJob(job);

	{
		std::lock_guard<std::mutex> lock(mutex_);
		running_job_id_ = 0;
		running_token_.reset();
		committing_ = false;
	}
	idle_cv_.notify_all();
	return true;
}

bool JobOrchestrator::ResumePendingJobs(size_t &resumed, std::string &error) {
	std::vector<TranscriptionJob> unfinished;
	if (!jobs_.ListUnfinishedJobs(unfinished, error)) {
		return false;
	}
	resumed = 0;
	for (auto &job : unfinished) {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (IsQueuedOrRunning(job.id)) {
				continue;
			}
			if (!jobs_.ResetJob(job.id, error)) {
				return false;
			}
			job.status = JobStatus::PENDING;
			job.progress = 0;
			job.error_message.clear();
			EnqueueLocked(job);
		}
		work_cv_.notify_one();
		resumed++;
	}
	if (resumed > 0) {
		LogStatus(GetConfig(), "Resumed " + std::to_string(resumed) + " interrupted job(s)");
	}
	return true;
}

bool JobOrchestrator::WaitUntilIdle(int64_t timeout_ms) {
	std::unique_lock<std::mutex> lock(mutex_);
	return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
	                         [this]() { return queue_.empty() && running_job_id_ == 0; });
}

bool JobOrchestrator::IsStopping() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return stopping_;
}

size_t JobOrchestrator::QueueSize() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return queue_.size();
}

int64_t JobOrchestrator::RunningJobId() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return running_job_id_;
}

void JobOrchestrator::SetStatus(int64_t job_id, JobStatus status, int32_t progress, const std::string &message) {
	std::string error;
	if (!jobs_.UpdateJob(job_id, status, progress, message, "", error)) {
		throw std::runtime_error("Failed to record job status: " + error);
	}
}

void JobOrchestrator::MarkCancelled(int64_t job_id, const ReadalongConfig &config) {
	std::string error;
	if (!jobs_.UpdateJob(job_id, JobStatus::CANCELLED, -1, "", CANCELLED_MESSAGE, error)) {
		LogError("Failed to mark job " + std::to_string(job_id) + " cancelled: " + error);
		return;
	}
	LogStatus(config, "Job " + std::to_string(job_id) + " cancelled");
}

void JobOrchestrator::MarkFailed(int64_t job_id, const std::string &reason, const ReadalongConfig &config) {
	std::string error;
	if (!jobs_.UpdateJob(job_id, JobStatus::FAILED, -1, "", reason, error)) {
		LogError("Failed to mark job " + std::to_string(job_id) + " failed (" + reason + "): " + error);
		return;
	}
	LogStatus(config, "Job " + std::to_string(job_id) + " failed: " + reason);
}

bool JobOrchestrator::BeginCommit(const QueuedJob &job) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (job.token->IsCancelled()) {
		return false;
	}
	committing_ = true;
	return true;
}

void JobOrchestrator::RunJob(const QueuedJob &job) {
	ReadalongConfig config = GetConfig();
	LogStatus(config, "Starting " + JobKindToString(job.kind) + " job " + std::to_string(job.job_id));
	try {
		JobOutcome outcome =
		    job.kind == JobKind::BOOK ? RunBookJob(job, config) : RunDocumentJob(job, config);
		if (outcome == JobOutcome::CANCELLED) {
			if (IsStopping()) {
				LogStatus(config, "Job " + std::to_string(job.job_id) + " interrupted by shutdown");
			} else {
				MarkCancelled(job.job_id, config);
			}
		}
	} catch (std::exception &ex) {
		MarkFailed(job.job_id, ex.what(), config);
	}
}

JobOrchestrator::JobOutcome JobOrchestrator::RunBookJob(const QueuedJob &job, const ReadalongConfig &config) {
	SetStatus(job.job_id, JobStatus::TRANSCRIBING, 5, "Preparing...");

	BookTranscript transcript;
	std::string error;
	ProgressCallback progress = [&](int32_t percent, const std::string &message) {
		if (!job.token->IsCancelled()) {
			SetStatus(job.job_id, JobStatus::TRANSCRIBING, Scale(5, percent, 0.9), message);
		}
	};
	if (!recognition_.TranscribeBook(job.subject_id, config, progress, transcript, error)) {
		throw std::runtime_error(error);
	}

	if (!BeginCommit(job)) {
		return JobOutcome::CANCELLED;
	}
	SetStatus(job.job_id, JobStatus::COMPLETED, 100,
	          "Transcribed " + std::to_string(transcript.sentences.size()) + " sentences");
	return JobOutcome::COMPLETED;
}

JobOrchestrator::JobOutcome JobOrchestrator::RunDocumentJob(const QueuedJob &job, const ReadalongConfig &config) {
	std::string error;

	// Stage 1: text extraction
	SetStatus(job.job_id, JobStatus::EXTRACTING, 10, "Extracting text from document");
	DocumentInfo info;
	if (!catalog_.FindDocument(job.subject_id, info, error)) {
		throw std::runtime_error(error.empty() ? "Document not found: " + std::to_string(job.subject_id) : error);
	}
	ExtractedDocument document;
	if (!extractor_.Extract(info.file_path, config.min_document_chars, document, error)) {
		throw std::runtime_error(error);
	}
	if (!catalog_.UpdateDocument(info.document_id, document.page_count, !document.has_text, error)) {
		throw std::runtime_error(error);
	}
	if (!document.has_text) {
		throw std::runtime_error(SCANNED_MESSAGE);
	}
	SetStatus(job.job_id, JobStatus::EXTRACTING, 30,
	          "Extracted " + std::to_string(document.SentenceCount()) + " sentences from " +
	              std::to_string(document.page_count) + " pages");
	if (job.token->IsCancelled()) {
		return JobOutcome::CANCELLED;
	}

	// Stage 2: transcription
	SetStatus(job.job_id, JobStatus::TRANSCRIBING, 40, "Transcribing audio");
	BookTranscript transcript;
	ProgressCallback progress = [&](int32_t percent, const std::string &message) {
		if (!job.token->IsCancelled()) {
			SetStatus(job.job_id, JobStatus::TRANSCRIBING, Scale(40, percent, 0.3), message);
		}
	};
	if (!recognition_.TranscribeBook(info.book_id, config, progress, transcript, error)) {
		throw std::runtime_error(error);
	}
	if (job.token->IsCancelled()) {
		return JobOutcome::CANCELLED;
	}

	// Stage 3: alignment
	SetStatus(job.job_id, JobStatus::ALIGNING, 75, "Aligning text with audio");
	AlignmentEngine engine(AlignmentOptions::FromConfig(config));
	AlignmentResult alignment = engine.Align(info.document_id, document, transcript);
	LogStatus(config, "Matched " + std::to_string(alignment.matched_count) + "/" +
	                      std::to_string(alignment.total_count) + " sentences (quality " +
	                      std::to_string(alignment.quality) + "%)");

	if (!BeginCommit(job)) {
		return JobOutcome::CANCELLED;
	}
	SetStatus(job.job_id, JobStatus::ALIGNING, 90, "Saving alignment");
	if (!alignments_.ReplaceAlignment(alignment, error)) {
		throw std::runtime_error(error);
	}
	std::string summary = "Aligned " + std::to_string(alignment.total_count) + " sentences, quality " +
	                      std::to_string(alignment.quality) + "%";
	if (!alignment.alignment_type.empty()) {
		summary += " (" + alignment.alignment_type + ")";
	}
	SetStatus(job.job_id, JobStatus::COMPLETED, 100, summary);
	return JobOutcome::COMPLETED;
}

} // namespace readalong
