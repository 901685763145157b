#pragma once

#include "readalong_store.hpp"

#include "duckdb.hpp"
#include "duckdb/main/connection.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace readalong {

// Every store of the pipeline, persisted in the database the extension is loaded into
class DuckDBStore : public JobStore,
                    public TranscriptStore,
                    public AlignmentStore,
                    public ChapterCatalog,
                    public SettingsStore {
public:
	explicit DuckDBStore(duckdb::DatabaseInstance &db);

	// Create the readalong_* tables when missing
	bool Initialize(std::string &error);

	// JobStore
	bool CreateJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override;
	bool FindJob(int64_t job_id, TranscriptionJob &job, std::string &error) override;
	bool FindActiveJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override;
	bool FindLatestJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) override;
	bool UpdateJob(int64_t job_id, JobStatus status, int32_t progress, const std::string &status_message,
	               const std::string &error_message, std::string &error) override;
	bool ResetJob(int64_t job_id, std::string &error) override;
	bool ListUnfinishedJobs(std::vector<TranscriptionJob> &jobs, std::string &error) override;

	// TranscriptStore
	bool FindChapterTranscript(int64_t book_id, int32_t chapter_index, ChapterTranscript &transcript,
	                           std::string &error) override;
	bool SaveChapterTranscript(const ChapterTranscript &transcript, std::string &error) override;
	bool DeleteBookTranscripts(int64_t book_id, int64_t &deleted, std::string &error) override;

	// AlignmentStore
	bool ReplaceAlignment(const AlignmentResult &alignment, std::string &error) override;
	bool FindAlignment(int64_t document_id, AlignmentResult &alignment, std::string &error) override;

	// ChapterCatalog
	bool ListChapters(int64_t book_id, std::vector<ChapterInfo> &chapters, std::string &error) override;
	bool FindDocument(int64_t document_id, DocumentInfo &document, std::string &error) override;
	bool UpdateDocument(int64_t document_id, int32_t page_count, bool is_scanned, std::string &error) override;

	// SettingsStore
	bool FindSetting(const std::string &key, std::string &value, std::string &error) override;
	bool PutSetting(const std::string &key, const std::string &value, std::string &error) override;

private:
	// A connection for one operation; fails once the database is closed
	duckdb::unique_ptr<duckdb::Connection> Connect(std::string &error);
	duckdb::unique_ptr<duckdb::QueryResult> Run(duckdb::Connection &con, const std::string &sql,
	                                            duckdb::vector<duckdb::Value> params, std::string &error);
	bool RunInTransaction(duckdb::Connection &con, const std::function<bool(std::string &)> &body,
	                      std::string &error);
	bool FindOneJob(duckdb::Connection &con, const std::string &sql, duckdb::vector<duckdb::Value> params,
	                TranscriptionJob &job, std::string &error);

	std::mutex mutex_;
	// Weak so the store never keeps a closed database alive
	duckdb::weak_ptr<duckdb::DatabaseInstance> db_;
};

} // namespace readalong
