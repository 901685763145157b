#include "duckdb_store.hpp"
#include "recognition_engine.hpp"

#include "duckdb.hpp"

#include "gtest/gtest.h"

namespace readalong {

class DuckDBStoreTest : public ::testing::Test {
protected:
	DuckDBStoreTest() : db(nullptr), store(*db.instance) {
	}

	void SetUp() override {
		std::string error;
		ASSERT_TRUE(store.Initialize(error)) << error;
	}

	void Exec(const std::string &sql) {
		duckdb::Connection con(db);
		auto result = con.Query(sql);
		ASSERT_FALSE(result->HasError()) << result->GetError();
	}

	duckdb::Value Scalar(const std::string &sql) {
		duckdb::Connection con(db);
		auto result = con.Query(sql);
		EXPECT_FALSE(result->HasError()) << result->GetError();
		return result->GetValue(0, 0);
	}

	duckdb::DuckDB db;
	DuckDBStore store;
};

TEST_F(DuckDBStoreTest, InitializeIsIdempotent) {
	std::string error;
	EXPECT_TRUE(store.Initialize(error)) << error;
}

TEST_F(DuckDBStoreTest, JobLifecycle) {
	TranscriptionJob job;
	std::string error;
	ASSERT_TRUE(store.CreateJob(JobKind::DOCUMENT, 7, job, error)) << error;
	EXPECT_GT(job.id, 0);
	EXPECT_EQ(job.kind, JobKind::DOCUMENT);
	EXPECT_EQ(job.subject_id, 7);
	EXPECT_EQ(job.status, JobStatus::PENDING);
	EXPECT_EQ(job.progress, 0);
	EXPECT_FALSE(job.created_at.empty());

	ASSERT_TRUE(store.UpdateJob(job.id, JobStatus::TRANSCRIBING, 40, "Transcribing audio", "", error)) << error;
	// Negative progress and empty messages keep the stored values
	ASSERT_TRUE(store.UpdateJob(job.id, JobStatus::ALIGNING, -1, "", "", error)) << error;

	TranscriptionJob found;
	ASSERT_TRUE(store.FindJob(job.id, found, error));
	EXPECT_EQ(found.status, JobStatus::ALIGNING);
	EXPECT_EQ(found.progress, 40);
	EXPECT_EQ(found.status_message, "Transcribing audio");
	EXPECT_TRUE(found.error_message.empty());

	TranscriptionJob active;
	ASSERT_TRUE(store.FindActiveJob(JobKind::DOCUMENT, 7, active, error));
	EXPECT_EQ(active.id, job.id);
	EXPECT_FALSE(store.FindActiveJob(JobKind::BOOK, 7, active, error));
	EXPECT_TRUE(error.empty());

	ASSERT_TRUE(store.UpdateJob(job.id, JobStatus::FAILED, -1, "", "boom", error));
	EXPECT_FALSE(store.FindActiveJob(JobKind::DOCUMENT, 7, active, error));
	EXPECT_TRUE(error.empty());

	TranscriptionJob latest;
	ASSERT_TRUE(store.FindLatestJob(JobKind::DOCUMENT, 7, latest, error));
	EXPECT_EQ(latest.status, JobStatus::FAILED);
	EXPECT_EQ(latest.error_message, "boom");

	EXPECT_FALSE(store.FindJob(job.id + 100, found, error));
	EXPECT_TRUE(error.empty());
}

TEST_F(DuckDBStoreTest, UnfinishedJobsAreListedOldestFirstAndReset) {
	TranscriptionJob first;
	TranscriptionJob second;
	TranscriptionJob done;
	std::string error;
	ASSERT_TRUE(store.CreateJob(JobKind::BOOK, 1, first, error));
	ASSERT_TRUE(store.CreateJob(JobKind::BOOK, 2, second, error));
	ASSERT_TRUE(store.CreateJob(JobKind::BOOK, 3, done, error));
	ASSERT_TRUE(store.UpdateJob(first.id, JobStatus::EXTRACTING, 10, "Extracting", "", error));
	ASSERT_TRUE(store.UpdateJob(done.id, JobStatus::COMPLETED, 100, "Done", "", error));

	std::vector<TranscriptionJob> jobs;
	ASSERT_TRUE(store.ListUnfinishedJobs(jobs, error)) << error;
	ASSERT_EQ(jobs.size(), 2u);
	EXPECT_EQ(jobs[0].id, first.id);
	EXPECT_EQ(jobs[1].id, second.id);

	ASSERT_TRUE(store.ResetJob(first.id, error));
	TranscriptionJob reset;
	ASSERT_TRUE(store.FindJob(first.id, reset, error));
	EXPECT_EQ(reset.status, JobStatus::PENDING);
	EXPECT_EQ(reset.progress, 0);
	EXPECT_TRUE(reset.status_message.empty());
}

TEST_F(DuckDBStoreTest, ChapterTranscriptsAreWrittenOnce) {
	ChapterTranscript transcript;
	transcript.book_id = 3;
	transcript.chapter_index = 1;
	transcript.duration = 12.5;
	transcript.is_synthetic = false;
	transcript.sentences.push_back(Sentence {"It's a \"quoted\" line.", 0.0, 2.5});
	transcript.sentences.push_back(Sentence {"Second.", 2.5, 4.0});

	std::string error;
	ASSERT_TRUE(store.SaveChapterTranscript(transcript, error)) << error;

	ChapterTranscript duplicate = transcript;
	duplicate.sentences.pop_back();
	EXPECT_FALSE(store.SaveChapterTranscript(duplicate, error));
	EXPECT_FALSE(error.empty());

	ChapterTranscript found;
	error.clear();
	ASSERT_TRUE(store.FindChapterTranscript(3, 1, found, error)) << error;
	EXPECT_DOUBLE_EQ(found.duration, 12.5);
	EXPECT_FALSE(found.is_synthetic);
	ASSERT_EQ(found.sentences.size(), 2u);
	EXPECT_EQ(found.sentences[0].text, "It's a \"quoted\" line.");
	EXPECT_DOUBLE_EQ(found.sentences[1].start, 2.5);
	EXPECT_DOUBLE_EQ(found.sentences[1].end, 4.0);

	EXPECT_FALSE(store.FindChapterTranscript(3, 2, found, error));
	EXPECT_TRUE(error.empty());

	int64_t deleted = 0;
	ASSERT_TRUE(store.DeleteBookTranscripts(3, deleted, error)) << error;
	EXPECT_EQ(deleted, 1);
	EXPECT_FALSE(store.FindChapterTranscript(3, 1, found, error));
	EXPECT_EQ(Scalar("SELECT count(*) FROM readalong_transcript_sentences").GetValue<int64_t>(), 0);
}

TEST_F(DuckDBStoreTest, SegmentsWithBrokenUtf8AreStored) {
	ChapterTranscript transcript;
	transcript.book_id = 4;
	transcript.chapter_index = 0;
	transcript.duration = 3.0;
	transcript.is_synthetic = false;
	TimedFragment fragment;
	fragment.text = "Cut off \xE2\x80";
	fragment.start_ms = 0;
	fragment.end_ms = 3000;
	transcript.sentences = SegmentFragments({fragment});

	std::string error;
	ASSERT_TRUE(store.SaveChapterTranscript(transcript, error)) << error;
	ChapterTranscript found;
	ASSERT_TRUE(store.FindChapterTranscript(4, 0, found, error)) << error;
	ASSERT_EQ(found.sentences.size(), 1u);
	EXPECT_EQ(found.sentences[0].text, "Cut off \xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_F(DuckDBStoreTest, AlignmentIsReplacedAtomically) {
	AlignmentResult alignment;
	alignment.document_id = 9;
	alignment.matched_count = 1;
	alignment.interpolated_count = 0;
	alignment.total_count = 2;
	alignment.audio_sentence_count = 5;
	alignment.average_confidence = 0.8;
	alignment.quality = 50;

	AlignmentPage page;
	page.page_number = 1;
	AlignmentRecord matched;
	matched.id = "p1s1";
	matched.page_number = 1;
	matched.index_in_page = 0;
	matched.text = "Matched.";
	matched.position = {72, 720, 468, 14};
	matched.has_audio = true;
	matched.audio = {2, 30.5, 33.0};
	matched.confidence = 0.8;
	matched.transcript_index = 4;
	page.sentences.push_back(matched);

	AlignmentRecord unmatched;
	unmatched.id = "p1s2";
	unmatched.page_number = 1;
	unmatched.index_in_page = 1;
	unmatched.text = "Unmatched.";
	unmatched.position = {72, 396, 468, 14};
	page.sentences.push_back(unmatched);
	alignment.pages.push_back(page);

	std::string error;
	ASSERT_TRUE(store.ReplaceAlignment(alignment, error)) << error;

	alignment.quality = 100;
	alignment.alignment_type = "time-based";
	ASSERT_TRUE(store.ReplaceAlignment(alignment, error)) << error;
	EXPECT_EQ(Scalar("SELECT count(*) FROM readalong_alignments").GetValue<int64_t>(), 1);
	EXPECT_EQ(Scalar("SELECT count(*) FROM readalong_alignment_sentences").GetValue<int64_t>(), 2);

	AlignmentResult found;
	ASSERT_TRUE(store.FindAlignment(9, found, error)) << error;
	EXPECT_EQ(found.quality, 100);
	EXPECT_EQ(found.alignment_type, "time-based");
	EXPECT_EQ(found.audio_sentence_count, 5);
	ASSERT_EQ(found.pages.size(), 1u);
	ASSERT_EQ(found.pages[0].sentences.size(), 2u);

	const auto &first = found.pages[0].sentences[0];
	EXPECT_TRUE(first.has_audio);
	EXPECT_EQ(first.audio.chapter_index, 2);
	EXPECT_DOUBLE_EQ(first.audio.global_end, 33.0);
	EXPECT_EQ(first.transcript_index, 4);

	const auto &second = found.pages[0].sentences[1];
	EXPECT_EQ(second.id, "p1s2");
	EXPECT_FALSE(second.has_audio);
	EXPECT_EQ(second.transcript_index, -1);
	EXPECT_DOUBLE_EQ(second.position.y, 396.0);

	EXPECT_FALSE(store.FindAlignment(10, found, error));
	EXPECT_TRUE(error.empty());
}

TEST_F(DuckDBStoreTest, CatalogReadsChaptersAndDocuments) {
	Exec("INSERT INTO readalong_chapters VALUES (1, 1, '/audio/b.mp3', NULL), (1, 0, '/audio/a.mp3', 61.5),"
	     " (2, 0, '/audio/other.mp3', 10)");
	Exec("INSERT INTO readalong_documents (document_id, book_id, file_path) VALUES (5, 1, '/docs/book.pdf')");

	std::vector<ChapterInfo> chapters;
	std::string error;
	ASSERT_TRUE(store.ListChapters(1, chapters, error)) << error;
	ASSERT_EQ(chapters.size(), 2u);
	EXPECT_EQ(chapters[0].chapter_index, 0);
	EXPECT_EQ(chapters[0].file_path, "/audio/a.mp3");
	EXPECT_DOUBLE_EQ(chapters[0].duration_seconds, 61.5);
	EXPECT_DOUBLE_EQ(chapters[1].duration_seconds, 0.0);

	DocumentInfo document;
	ASSERT_TRUE(store.FindDocument(5, document, error));
	EXPECT_EQ(document.book_id, 1);
	EXPECT_EQ(document.file_path, "/docs/book.pdf");
	EXPECT_FALSE(store.FindDocument(6, document, error));
	EXPECT_TRUE(error.empty());

	ASSERT_TRUE(store.UpdateDocument(5, 12, true, error)) << error;
	EXPECT_EQ(Scalar("SELECT page_count FROM readalong_documents WHERE document_id = 5").GetValue<int32_t>(), 12);
	EXPECT_TRUE(Scalar("SELECT is_scanned FROM readalong_documents WHERE document_id = 5").GetValue<bool>());
}

TEST_F(DuckDBStoreTest, SettingsAreUpserted) {
	std::string value;
	std::string error;
	EXPECT_FALSE(store.FindSetting("backend", value, error));
	EXPECT_TRUE(error.empty());

	ASSERT_TRUE(store.PutSetting("backend", "cuda", error)) << error;
	ASSERT_TRUE(store.PutSetting("backend", "cpu", error)) << error;
	ASSERT_TRUE(store.FindSetting("backend", value, error));
	EXPECT_EQ(value, "cpu");
}

TEST(DuckDBStoreLifetimeTest, StoreDoesNotKeepTheDatabaseOpen) {
	auto db = duckdb::make_uniq<duckdb::DuckDB>(nullptr);
	DuckDBStore store(*db->instance);
	std::string error;
	ASSERT_TRUE(store.Initialize(error)) << error;
	ASSERT_TRUE(store.PutSetting("backend", "cpu", error)) << error;

	duckdb::weak_ptr<duckdb::DatabaseInstance> instance = db->instance;
	db.reset();
	EXPECT_TRUE(instance.expired());

	std::string value;
	EXPECT_FALSE(store.FindSetting("backend", value, error));
	EXPECT_EQ(error, "Database has been closed");
	TranscriptionJob job;
	EXPECT_FALSE(store.CreateJob(JobKind::BOOK, 1, job, error));
	EXPECT_FALSE(error.empty());
}

} // namespace readalong
