#include "job_orchestrator.hpp"
#include "test_support.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace readalong {

using testing::FakeEngineFactory;
using testing::FakeEngineState;
using testing::FakeModelResolver;
using testing::FakeProbes;
using testing::FakeTextExtractor;
using testing::Fragment;
using testing::MakeTempFile;
using testing::MemoryStore;
using testing::Platform;

static const char *const DOCUMENT_TEXT = "Alice walked into the garden. Bob followed her slowly. "
                                         "Carol stayed inside reading. Dave cooked dinner for everyone.";

class JobOrchestratorTest : public ::testing::Test {
protected:
	JobOrchestratorTest()
	    : state(std::make_shared<FakeEngineState>()),
	      selector(Platform("linux", "x64"), FakeProbes(false, false), FakeEngineFactory(state),
	               FakeModelResolver()),
	      recognition(selector, store, store), orchestrator(store, store, store, recognition, extractor) {
		ReadalongConfig config;
		config.min_document_chars = 20;
		orchestrator.UpdateConfig(config);
	}

	void AddBook(int64_t book_id, const std::string &name) {
		auto path = MakeTempFile(name + ".mp3");
		store.AddChapter(book_id, 0, path, 20.0);
		state->fragments[path] = {Fragment("Alice walked into the garden.", 0, 3000),
		                          Fragment("Bob followed her slowly.", 3000, 6000),
		                          Fragment("Carol stayed inside reading.", 6000, 9000),
		                          Fragment("Dave cooked dinner for everyone.", 9000, 12000)};
	}

	TranscriptionJob Start(JobKind kind, int64_t subject_id) {
		TranscriptionJob job;
		std::string error;
		EXPECT_TRUE(orchestrator.StartJob(kind, subject_id, job, error)) << error;
		return job;
	}

	bool Saw(int64_t job_id, JobStatus status) {
		auto history = store.StatusHistory();
		return std::find(history.begin(), history.end(), std::make_pair(job_id, status)) != history.end();
	}

	std::shared_ptr<FakeEngineState> state;
	MemoryStore store;
	FakeTextExtractor extractor;
	BackendSelector selector;
	RecognitionEngine recognition;
	JobOrchestrator orchestrator;
};

TEST(CancelOutcomeTest, Names) {
	EXPECT_EQ(CancelOutcomeToString(CancelOutcome::CANCELLED), "cancelled");
	EXPECT_EQ(CancelOutcomeToString(CancelOutcome::NOT_FOUND), "job not found");
}

TEST_F(JobOrchestratorTest, BookJobRunsToCompletion) {
	AddBook(1, "orchestrator_book");
	auto job = Start(JobKind::BOOK, 1);
	EXPECT_EQ(job.status, JobStatus::PENDING);
	EXPECT_EQ(orchestrator.QueueSize(), 1u);

	EXPECT_TRUE(orchestrator.ProcessNext());
	EXPECT_FALSE(orchestrator.ProcessNext());

	auto finished = store.Job(job.id);
	EXPECT_EQ(finished.status, JobStatus::COMPLETED);
	EXPECT_EQ(finished.progress, 100);
	EXPECT_TRUE(finished.error_message.empty());
	EXPECT_EQ(store.ProgressHistory(), std::vector<int32_t>({5, 5, 95, 100}));
	EXPECT_EQ(orchestrator.RunningJobId(), 0);
}

TEST_F(JobOrchestratorTest, DocumentJobPersistsAlignment) {
	AddBook(2, "orchestrator_document");
	store.AddDocument(20, 2, "/books/two.pdf");
	extractor.AddPage(DOCUMENT_TEXT);

	auto job = Start(JobKind::DOCUMENT, 20);
	ASSERT_TRUE(orchestrator.ProcessNext());

	auto finished = store.Job(job.id);
	EXPECT_EQ(finished.status, JobStatus::COMPLETED) << finished.error_message;
	EXPECT_EQ(finished.status_message, "Aligned 4 sentences, quality 100%");
	EXPECT_EQ(store.ProgressHistory(), std::vector<int32_t>({10, 30, 40, 40, 70, 75, 90, 100}));
	EXPECT_TRUE(Saw(job.id, JobStatus::EXTRACTING));
	EXPECT_TRUE(Saw(job.id, JobStatus::TRANSCRIBING));
	EXPECT_TRUE(Saw(job.id, JobStatus::ALIGNING));

	AlignmentResult alignment;
	std::string error;
	ASSERT_TRUE(store.FindAlignment(20, alignment, error));
	EXPECT_EQ(alignment.matched_count, 4);
	EXPECT_EQ(alignment.quality, 100);
	EXPECT_EQ(store.PageCount(20), 1);
	EXPECT_FALSE(store.IsScanned(20));
}

TEST_F(JobOrchestratorTest, StartJobReturnsTheActiveJob) {
	AddBook(3, "orchestrator_active");
	auto first = Start(JobKind::BOOK, 3);
	auto second = Start(JobKind::BOOK, 3);
	EXPECT_EQ(first.id, second.id);
	EXPECT_EQ(orchestrator.QueueSize(), 1u);

	ASSERT_TRUE(orchestrator.ProcessNext());
	auto third = Start(JobKind::BOOK, 3);
	EXPECT_NE(third.id, first.id);
}

TEST_F(JobOrchestratorTest, StartJobValidatesSubject) {
	TranscriptionJob job;
	std::string error;
	EXPECT_FALSE(orchestrator.StartJob(JobKind::DOCUMENT, 404, job, error));
	EXPECT_EQ(error, "Document not found: 404");

	error.clear();
	EXPECT_FALSE(orchestrator.StartJob(JobKind::BOOK, 404, job, error));
	EXPECT_EQ(error, "No chapters found for book 404");
	EXPECT_EQ(orchestrator.QueueSize(), 0u);
}

TEST_F(JobOrchestratorTest, CancellingAQueuedJobRunsNoStage) {
	AddBook(4, "orchestrator_queued");
	auto job = Start(JobKind::BOOK, 4);

	CancelOutcome outcome;
	std::string error;
	ASSERT_TRUE(orchestrator.Cancel(job.id, outcome, error)) << error;
	EXPECT_EQ(outcome, CancelOutcome::CANCELLED);

	EXPECT_FALSE(orchestrator.ProcessNext());
	auto cancelled = store.Job(job.id);
	EXPECT_EQ(cancelled.status, JobStatus::CANCELLED);
	EXPECT_EQ(cancelled.error_message, "Cancelled by user");
	EXPECT_FALSE(Saw(job.id, JobStatus::TRANSCRIBING));
	EXPECT_EQ(state->transcribe_calls, 0);
}

TEST_F(JobOrchestratorTest, CancellingARunningJobStopsBeforeAlignment) {
	AddBook(5, "orchestrator_running");
	store.AddDocument(50, 5, "/books/five.pdf");
	extractor.AddPage(DOCUMENT_TEXT);
	auto job = Start(JobKind::DOCUMENT, 50);

	CancelOutcome outcome = CancelOutcome::NOT_FOUND;
	state->on_transcribe = [&](const std::string &) {
		std::string error;
		EXPECT_TRUE(orchestrator.Cancel(job.id, outcome, error));
	};

	ASSERT_TRUE(orchestrator.ProcessNext());
	EXPECT_EQ(outcome, CancelOutcome::REQUESTED);

	auto cancelled = store.Job(job.id);
	EXPECT_EQ(cancelled.status, JobStatus::CANCELLED);
	EXPECT_EQ(cancelled.error_message, "Cancelled by user");
	EXPECT_FALSE(Saw(job.id, JobStatus::ALIGNING));
	EXPECT_FALSE(store.HasAlignment(50));

	// The chapter finished before the cancellation took effect and stays cached
	ChapterTranscript cached;
	std::string error;
	EXPECT_TRUE(store.FindChapterTranscript(5, 0, cached, error));
}

TEST_F(JobOrchestratorTest, CancelWhileCreatingWaitsForTheQueue) {
	AddBook(14, "orchestrator_creating");

	std::future<CancelOutcome> cancelled;
	store.on_create = [&](int64_t job_id) {
		cancelled = std::async(std::launch::async, [this, job_id]() {
			CancelOutcome outcome = CancelOutcome::NOT_FOUND;
			std::string error;
			EXPECT_TRUE(orchestrator.Cancel(job_id, outcome, error)) << error;
			return outcome;
		});
	};
	auto job = Start(JobKind::BOOK, 14);
	store.on_create = nullptr;

	ASSERT_TRUE(cancelled.valid());
	EXPECT_EQ(cancelled.get(), CancelOutcome::CANCELLED);
	EXPECT_FALSE(orchestrator.ProcessNext());
	EXPECT_EQ(store.Job(job.id).status, JobStatus::CANCELLED);
	EXPECT_EQ(state->transcribe_calls, 0);
	EXPECT_EQ(store.StatusHistory().size(), 1u);
}

TEST_F(JobOrchestratorTest, StopLeavesTheRunningJobForResume) {
	AddBook(15, "orchestrator_shutdown");
	auto job = Start(JobKind::BOOK, 15);
	state->on_transcribe = [&](const std::string &) { orchestrator.Stop(); };

	ASSERT_TRUE(orchestrator.ProcessNext());
	EXPECT_TRUE(orchestrator.IsStopping());

	auto interrupted = store.Job(job.id);
	EXPECT_EQ(interrupted.status, JobStatus::TRANSCRIBING);
	EXPECT_FALSE(Saw(job.id, JobStatus::CANCELLED));
	EXPECT_FALSE(Saw(job.id, JobStatus::COMPLETED));

	std::vector<TranscriptionJob> unfinished;
	std::string error;
	ASSERT_TRUE(store.ListUnfinishedJobs(unfinished, error));
	ASSERT_EQ(unfinished.size(), 1u);
	EXPECT_EQ(unfinished[0].id, job.id);
}

TEST_F(JobOrchestratorTest, CancelReportsFinishedAndUnknownJobs) {
	AddBook(6, "orchestrator_finished");
	auto job = Start(JobKind::BOOK, 6);
	ASSERT_TRUE(orchestrator.ProcessNext());

	CancelOutcome outcome;
	std::string error;
	ASSERT_TRUE(orchestrator.Cancel(job.id, outcome, error));
	EXPECT_EQ(outcome, CancelOutcome::NOT_CANCELLABLE);
	EXPECT_EQ(store.Job(job.id).status, JobStatus::COMPLETED);

	ASSERT_TRUE(orchestrator.Cancel(999, outcome, error));
	EXPECT_EQ(outcome, CancelOutcome::NOT_FOUND);
}

TEST_F(JobOrchestratorTest, OrphanedJobCanBeCancelled) {
	auto orphan = store.InsertJob(JobKind::BOOK, 7, JobStatus::TRANSCRIBING, 40);

	CancelOutcome outcome;
	std::string error;
	ASSERT_TRUE(orchestrator.Cancel(orphan, outcome, error));
	EXPECT_EQ(outcome, CancelOutcome::CANCELLED);
	EXPECT_EQ(store.Job(orphan).status, JobStatus::CANCELLED);
}

TEST_F(JobOrchestratorTest, StageFailureMarksJobFailed) {
	store.AddChapter(8, 0, "/nonexistent/orchestrator_missing.mp3", 10.0);
	auto job = Start(JobKind::BOOK, 8);
	ASSERT_TRUE(orchestrator.ProcessNext());

	auto failed = store.Job(job.id);
	EXPECT_EQ(failed.status, JobStatus::FAILED);
	EXPECT_NE(failed.error_message.find("Audio file not found"), std::string::npos);
}

TEST_F(JobOrchestratorTest, ScannedDocumentFailsWithoutTranscribing) {
	AddBook(9, "orchestrator_scanned");
	store.AddDocument(90, 9, "/books/scan.pdf");
	extractor.AddPage("  3 ");
	extractor.AddPage("");

	auto job = Start(JobKind::DOCUMENT, 90);
	ASSERT_TRUE(orchestrator.ProcessNext());

	auto failed = store.Job(job.id);
	EXPECT_EQ(failed.status, JobStatus::FAILED);
	EXPECT_EQ(failed.error_message, "Document appears to be scanned/image-based; OCR is not supported");
	EXPECT_TRUE(store.IsScanned(90));
	EXPECT_EQ(store.PageCount(90), 2);
	EXPECT_EQ(state->transcribe_calls, 0);
}

TEST_F(JobOrchestratorTest, ExtractionErrorFailsTheJob) {
	AddBook(10, "orchestrator_broken_pdf");
	store.AddDocument(100, 10, "/books/broken.pdf");
	extractor.SetError("Failed to load PDF /books/broken.pdf: file is not a PDF or is corrupted");

	auto job = Start(JobKind::DOCUMENT, 100);
	ASSERT_TRUE(orchestrator.ProcessNext());
	EXPECT_EQ(store.Job(job.id).status, JobStatus::FAILED);
	EXPECT_NE(store.Job(job.id).error_message.find("corrupted"), std::string::npos);
}

TEST_F(JobOrchestratorTest, InterruptedJobsResumeExactlyOnce) {
	AddBook(11, "orchestrator_resume");
	auto interrupted = store.InsertJob(JobKind::BOOK, 11, JobStatus::TRANSCRIBING, 50);
	store.InsertJob(JobKind::BOOK, 11, JobStatus::COMPLETED, 100);

	size_t resumed = 0;
	std::string error;
	ASSERT_TRUE(orchestrator.ResumePendingJobs(resumed, error)) << error;
	EXPECT_EQ(resumed, 1u);
	EXPECT_EQ(store.Resets(), 1);
	EXPECT_EQ(store.Job(interrupted).status, JobStatus::PENDING);
	EXPECT_EQ(store.Job(interrupted).progress, 0);

	ASSERT_TRUE(orchestrator.ResumePendingJobs(resumed, error));
	EXPECT_EQ(resumed, 0u);
	EXPECT_EQ(orchestrator.QueueSize(), 1u);

	ASSERT_TRUE(orchestrator.ProcessNext());
	EXPECT_EQ(store.Job(interrupted).status, JobStatus::COMPLETED);
	EXPECT_FALSE(orchestrator.ProcessNext());
}

TEST_F(JobOrchestratorTest, WorkerThreadDrainsTheQueue) {
	AddBook(12, "orchestrator_worker_a");
	AddBook(13, "orchestrator_worker_b");
	orchestrator.Start();

	auto first = Start(JobKind::BOOK, 12);
	auto second = Start(JobKind::BOOK, 13);
	ASSERT_TRUE(orchestrator.WaitUntilIdle(10000));
	orchestrator.Stop();

	EXPECT_EQ(store.Job(first.id).status, JobStatus::COMPLETED);
	EXPECT_EQ(store.Job(second.id).status, JobStatus::COMPLETED);
	EXPECT_EQ(state->transcribe_calls, 2);
}

TEST_F(JobOrchestratorTest, WorkerKeepsItsOwnerUntilStopped) {
	auto owner = std::make_shared<int>(1);
	std::weak_ptr<int> watch = owner;
	orchestrator.Start(owner);
	owner.reset();
	EXPECT_FALSE(watch.expired());

	orchestrator.Stop();
	EXPECT_TRUE(watch.expired());
}

// A worker that owns the last reference to its own orchestrator
struct OwnedPipeline {
	OwnedPipeline()
	    : state(std::make_shared<FakeEngineState>()),
	      selector(Platform("linux", "x64"), FakeProbes(false, false), FakeEngineFactory(state),
	               FakeModelResolver()),
	      recognition(selector, store, store), orchestrator(store, store, store, recognition, extractor) {
	}

	std::shared_ptr<FakeEngineState> state;
	MemoryStore store;
	FakeTextExtractor extractor;
	BackendSelector selector;
	RecognitionEngine recognition;
	JobOrchestrator orchestrator;
};

TEST(JobOrchestratorOwnershipTest, WorkerReleasesTheLastReference) {
	auto pipeline = std::make_shared<OwnedPipeline>();
	std::weak_ptr<OwnedPipeline> watch = pipeline;
	pipeline->orchestrator.Start(pipeline);
	std::shared_ptr<OwnedPipeline> handle(pipeline.get(),
	                                      [pipeline](OwnedPipeline *owned) { owned->orchestrator.RequestStop(); });
	pipeline.reset();
	EXPECT_FALSE(watch.expired());
	handle.reset();

	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
	while (!watch.expired() && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	EXPECT_TRUE(watch.expired());
}

} // namespace readalong
