#include "duckdb_store.hpp"

#include "duckdb/main/appender.hpp"
#include "duckdb/main/materialized_query_result.hpp"
#include "duckdb/main/prepared_statement.hpp"

namespace readalong {

using duckdb::idx_t;
using duckdb::LogicalType;
using duckdb::MaterializedQueryResult;
using duckdb::Value;

static const char *const SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS readalong_chapters ("
    " book_id BIGINT NOT NULL, chapter_index INTEGER NOT NULL, file_path VARCHAR NOT NULL,"
    " duration_seconds DOUBLE, PRIMARY KEY (book_id, chapter_index))",

    "CREATE TABLE IF NOT EXISTS readalong_documents ("
    " document_id BIGINT PRIMARY KEY, book_id BIGINT NOT NULL, file_path VARCHAR NOT NULL,"
    " page_count INTEGER, is_scanned BOOLEAN DEFAULT false)",

    "CREATE SEQUENCE IF NOT EXISTS readalong_job_id_seq",

    "CREATE TABLE IF NOT EXISTS readalong_jobs ("
    " id BIGINT PRIMARY KEY DEFAULT nextval('readalong_job_id_seq'), kind VARCHAR NOT NULL,"
    " subject_id BIGINT NOT NULL, status VARCHAR NOT NULL, progress INTEGER NOT NULL DEFAULT 0,"
    " status_message VARCHAR, error_message VARCHAR,"
    " created_at TIMESTAMP DEFAULT current_timestamp, updated_at TIMESTAMP DEFAULT current_timestamp)",

    "CREATE TABLE IF NOT EXISTS readalong_chapter_transcripts ("
    " book_id BIGINT NOT NULL, chapter_index INTEGER NOT NULL, duration_seconds DOUBLE NOT NULL,"
    " is_synthetic BOOLEAN NOT NULL, created_at TIMESTAMP DEFAULT current_timestamp,"
    " PRIMARY KEY (book_id, chapter_index))",

    "CREATE TABLE IF NOT EXISTS readalong_transcript_sentences ("
    " book_id BIGINT NOT NULL, chapter_index INTEGER NOT NULL, sentence_index INTEGER NOT NULL,"
    " text VARCHAR NOT NULL, start_seconds DOUBLE NOT NULL, end_seconds DOUBLE NOT NULL)",

    "CREATE TABLE IF NOT EXISTS readalong_alignments ("
    " document_id BIGINT NOT NULL, quality INTEGER NOT NULL, matched_count BIGINT NOT NULL,"
    " interpolated_count BIGINT NOT NULL, total_count BIGINT NOT NULL, audio_sentence_count BIGINT NOT NULL,"
    " average_confidence DOUBLE NOT NULL, alignment_type VARCHAR,"
    " created_at TIMESTAMP DEFAULT current_timestamp)",

    "CREATE TABLE IF NOT EXISTS readalong_alignment_sentences ("
    " document_id BIGINT NOT NULL, page_number INTEGER NOT NULL, index_in_page INTEGER NOT NULL,"
    " sentence_id VARCHAR NOT NULL, text VARCHAR NOT NULL, x DOUBLE, y DOUBLE, width DOUBLE, height DOUBLE,"
    " chapter_index INTEGER, global_start DOUBLE, global_end DOUBLE, confidence DOUBLE NOT NULL,"
    " interpolated BOOLEAN NOT NULL, transcript_index BIGINT)",

    "CREATE TABLE IF NOT EXISTS readalong_settings (key VARCHAR PRIMARY KEY, value VARCHAR)"};

static const char *const JOB_COLUMNS = "SELECT id, kind, subject_id, status, progress, status_message, error_message,"
                                       " CAST(created_at AS VARCHAR), CAST(updated_at AS VARCHAR)"
                                       " FROM readalong_jobs ";

static const char *const UNFINISHED = "status NOT IN ('completed', 'failed', 'cancelled')";

static std::string StringOrEmpty(const Value &value) {
	return value.IsNull() ? std::string() : value.GetValue<std::string>();
}

static Value NullableString(const std::string &str) {
	return str.empty() ? Value(LogicalType::VARCHAR) : Value(str);
}

static bool ReadJob(MaterializedQueryResult &rows, idx_t row, TranscriptionJob &job, std::string &error) {
	job.id = rows.GetValue(0, row).GetValue<int64_t>();
	if (!JobKindFromString(rows.GetValue(1, row).GetValue<std::string>(), job.kind)) {
		error = "Unknown job kind stored for job " + std::to_string(job.id);
		return false;
	}
	job.subject_id = rows.GetValue(2, row).GetValue<int64_t>();
	if (!JobStatusFromString(rows.GetValue(3, row).GetValue<std::string>(), job.status)) {
		error = "Unknown job status stored for job " + std::to_string(job.id);
		return false;
	}
	job.progress = rows.GetValue(4, row).GetValue<int32_t>();
	job.status_message = StringOrEmpty(rows.GetValue(5, row));
	job.error_message = StringOrEmpty(rows.GetValue(6, row));
	job.created_at = StringOrEmpty(rows.GetValue(7, row));
	job.updated_at = StringOrEmpty(rows.GetValue(8, row));
	return true;
}

DuckDBStore::DuckDBStore(duckdb::DatabaseInstance &db) : db_(db.shared_from_this()) {
}

duckdb::unique_ptr<Connection> DuckDBStore::Connect(std::string &error) {
	auto db = db_.lock();
	if (!db) {
		error = "Database has been closed";
		return nullptr;
	}
	return make_uniq<Connection>(*db);
}

duckdb::unique_ptr<duckdb::QueryResult> DuckDBStore::Run(Connection &con, const std::string &sql,
                                                         duckdb::vector<Value> params, std::string &error) {
	auto statement = con.Prepare(sql);
	if (statement->HasError()) {
		error = statement->GetError();
		return nullptr;
	}
	auto result = statement->Execute(params, false);
	if (result->HasError()) {
		error = result->GetError();
		return nullptr;
	}
	return result;
}

bool DuckDBStore::RunInTransaction(Connection &con, const std::function<bool(std::string &)> &body,
                                   std::string &error) {
	auto begin = con.Query("BEGIN TRANSACTION");
	if (begin->HasError()) {
		error = begin->GetError();
		return false;
	}
	bool ok = false;
	try {
		ok = body(error);
	} catch (std::exception &ex) {
		error = ex.what();
		ok = false;
	}
	if (!ok) {
		auto rollback = con.Query("ROLLBACK");
		if (rollback->HasError()) {
			error += "; rollback failed: " + rollback->GetError();
		}
		return false;
	}
	auto commit = con.Query("COMMIT");
	if (commit->HasError()) {
		error = commit->GetError();
		return false;
	}
	return true;
}

bool DuckDBStore::Initialize(std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	for (auto sql : SCHEMA) {
		auto result = con->Query(sql);
		if (result->HasError()) {
			error = result->GetError();
			return false;
		}
	}
	return true;
}

bool DuckDBStore::FindOneJob(Connection &con, const std::string &sql, duckdb::vector<Value> params,
                             TranscriptionJob &job, std::string &error) {
	error.clear();
	auto result = Run(con, sql, std::move(params), error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	if (rows.RowCount() == 0) {
		return false;
	}
	return ReadJob(rows, 0, job, error);
}

bool DuckDBStore::CreateJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result = Run(*con, "INSERT INTO readalong_jobs (kind, subject_id, status, progress)"
	                        " VALUES ($1, $2, 'pending', 0) RETURNING id",
	                        {Value(JobKindToString(kind)), Value::BIGINT(subject_id)}, error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	if (rows.RowCount() == 0) {
		error = "Job insert returned no id";
		return false;
	}
	int64_t id = rows.GetValue(0, 0).GetValue<int64_t>();
	if (!FindOneJob(*con, std::string(JOB_COLUMNS) + "WHERE id = $1", {Value::BIGINT(id)}, job, error)) {
		if (error.empty()) {
			error = "Created job " + std::to_string(id) + " not found";
		}
		return false;
	}
	return true;
}

bool DuckDBStore::FindJob(int64_t job_id, TranscriptionJob &job, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return FindOneJob(*con, std::string(JOB_COLUMNS) + "WHERE id = $1", {Value::BIGINT(job_id)}, job, error);
}

bool DuckDBStore::FindActiveJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return FindOneJob(*con, std::string(JOB_COLUMNS) + "WHERE kind = $1 AND subject_id = $2 AND " + UNFINISHED +
	                            " ORDER BY created_at DESC, id DESC LIMIT 1",
	                        {Value(JobKindToString(kind)), Value::BIGINT(subject_id)}, job, error);
}

bool DuckDBStore::FindLatestJob(JobKind kind, int64_t subject_id, TranscriptionJob &job, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return FindOneJob(*con, std::string(JOB_COLUMNS) +
	                            "WHERE kind = $1 AND subject_id = $2 ORDER BY created_at DESC, id DESC LIMIT 1",
	                        {Value(JobKindToString(kind)), Value::BIGINT(subject_id)}, job, error);
}

bool DuckDBStore::UpdateJob(int64_t job_id, JobStatus status, int32_t progress, const std::string &status_message,
                            const std::string &error_message, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	Value progress_value = progress < 0 ? Value(LogicalType::INTEGER) : Value::INTEGER(progress);
	auto result = Run(*con, "UPDATE readalong_jobs SET status = $2, progress = COALESCE($3, progress),"
	                        " status_message = COALESCE($4, status_message), error_message = COALESCE($5, error_message),"
	                        " updated_at = current_timestamp WHERE id = $1",
	                        {Value::BIGINT(job_id), Value(JobStatusToString(status)), progress_value,
	                         NullableString(status_message), NullableString(error_message)},
	                        error);
	return result != nullptr;
}

bool DuckDBStore::ResetJob(int64_t job_id, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result = Run(*con, "UPDATE readalong_jobs SET status = 'pending', progress = 0, status_message = NULL,"
	                        " error_message = NULL, updated_at = current_timestamp WHERE id = $1",
	                        {Value::BIGINT(job_id)}, error);
	return result != nullptr;
}

bool DuckDBStore::ListUnfinishedJobs(std::vector<TranscriptionJob> &jobs, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result =
	    Run(*con, std::string(JOB_COLUMNS) + "WHERE " + UNFINISHED + " ORDER BY created_at ASC, id ASC", {}, error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	jobs.clear();
	for (idx_t row = 0; row < rows.RowCount(); row++) {
		TranscriptionJob job;
		if (!ReadJob(rows, row, job, error)) {
			return false;
		}
		jobs.push_back(job);
	}
	return true;
}

bool DuckDBStore::FindChapterTranscript(int64_t book_id, int32_t chapter_index, ChapterTranscript &transcript,
                                        std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	error.clear();
	auto header = Run(*con, "SELECT duration_seconds, is_synthetic FROM readalong_chapter_transcripts"
	                        " WHERE book_id = $1 AND chapter_index = $2",
	                        {Value::BIGINT(book_id), Value::INTEGER(chapter_index)}, error);
	if (!header) {
		return false;
	}
	auto &header_rows = header->Cast<MaterializedQueryResult>();
	if (header_rows.RowCount() == 0) {
		return false;
	}

	transcript = ChapterTranscript();
	transcript.book_id = book_id;
	transcript.chapter_index = chapter_index;
	transcript.duration = header_rows.GetValue(0, 0).GetValue<double>();
	transcript.is_synthetic = header_rows.GetValue(1, 0).GetValue<bool>();

	auto sentences = Run(*con, "SELECT text, start_seconds, end_seconds FROM readalong_transcript_sentences"
	                           " WHERE book_id = $1 AND chapter_index = $2 ORDER BY sentence_index",
	                           {Value::BIGINT(book_id), Value::INTEGER(chapter_index)}, error);
	if (!sentences) {
		return false;
	}
	auto &rows = sentences->Cast<MaterializedQueryResult>();
	for (idx_t row = 0; row < rows.RowCount(); row++) {
		Sentence sentence;
		sentence.text = rows.GetValue(0, row).GetValue<std::string>();
		sentence.start = rows.GetValue(1, row).GetValue<double>();
		sentence.end = rows.GetValue(2, row).GetValue<double>();
		transcript.sentences.push_back(sentence);
	}
	return true;
}

bool DuckDBStore::SaveChapterTranscript(const ChapterTranscript &transcript, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return RunInTransaction(
	    *con,
	    [&](std::string &err) {
		    // Primary key rejects a second write of the same chapter
		    if (!Run(*con,
		             "INSERT INTO readalong_chapter_transcripts (book_id, chapter_index, duration_seconds,"
		             " is_synthetic) VALUES ($1, $2, $3, $4)",
		             {Value::BIGINT(transcript.book_id), Value::INTEGER(transcript.chapter_index),
		              Value::DOUBLE(transcript.duration), Value::BOOLEAN(transcript.is_synthetic)},
		             err)) {
			    return false;
		    }
		    duckdb::Appender appender(*con, "readalong_transcript_sentences");
		    for (size_t i = 0; i < transcript.sentences.size(); i++) {
			    const auto &sentence = transcript.sentences[i];
			    appender.BeginRow();
			    appender.Append<int64_t>(transcript.book_id);
			    appender.Append<int32_t>(transcript.chapter_index);
			    appender.Append<int32_t>(static_cast<int32_t>(i));
			    appender.Append<Value>(Value(sentence.text));
			    appender.Append<double>(sentence.start);
			    appender.Append<double>(sentence.end);
			    appender.EndRow();
		    }
		    appender.Close();
		    return true;
	    },
	    error);
}

bool DuckDBStore::DeleteBookTranscripts(int64_t book_id, int64_t &deleted, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return RunInTransaction(
	    *con,
	    [&](std::string &err) {
		    if (!Run(*con, "DELETE FROM readalong_transcript_sentences WHERE book_id = $1", {Value::BIGINT(book_id)},
		             err)) {
			    return false;
		    }
		    auto result = Run(*con, "DELETE FROM readalong_chapter_transcripts WHERE book_id = $1",
		                            {Value::BIGINT(book_id)}, err);
		    if (!result) {
			    return false;
		    }
		    auto &rows = result->Cast<MaterializedQueryResult>();
		    deleted = rows.RowCount() > 0 ? rows.GetValue(0, 0).GetValue<int64_t>() : 0;
		    return true;
	    },
	    error);
}

bool DuckDBStore::ReplaceAlignment(const AlignmentResult &alignment, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	return RunInTransaction(
	    *con,
	    [&](std::string &err) {
		    Value document_id = Value::BIGINT(alignment.document_id);
		    if (!Run(*con, "DELETE FROM readalong_alignment_sentences WHERE document_id = $1", {document_id}, err) ||
		        !Run(*con, "DELETE FROM readalong_alignments WHERE document_id = $1", {document_id}, err)) {
			    return false;
		    }
		    if (!Run(*con, "INSERT INTO readalong_alignments (document_id, quality, matched_count, interpolated_count,"
		                   " total_count, audio_sentence_count, average_confidence, alignment_type)"
		                   " VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
		                   {document_id, Value::INTEGER(alignment.quality), Value::BIGINT(alignment.matched_count),
		                    Value::BIGINT(alignment.interpolated_count), Value::BIGINT(alignment.total_count),
		                    Value::BIGINT(alignment.audio_sentence_count), Value::DOUBLE(alignment.average_confidence),
		                    NullableString(alignment.alignment_type)},
		                   err)) {
			    return false;
		    }

		    duckdb::Appender appender(*con, "readalong_alignment_sentences");
		    for (const auto &page : alignment.pages) {
			    for (const auto &record : page.sentences) {
				    appender.BeginRow();
				    appender.Append<int64_t>(alignment.document_id);
				    appender.Append<int32_t>(record.page_number);
				    appender.Append<int32_t>(record.index_in_page);
				    appender.Append<Value>(Value(record.id));
				    appender.Append<Value>(Value(record.text));
				    appender.Append<double>(record.position.x);
				    appender.Append<double>(record.position.y);
				    appender.Append<double>(record.position.width);
				    appender.Append<double>(record.position.height);
				    if (record.has_audio) {
					    appender.Append<int32_t>(record.audio.chapter_index);
					    appender.Append<double>(record.audio.global_start);
					    appender.Append<double>(record.audio.global_end);
				    } else {
					    appender.Append<Value>(Value(LogicalType::INTEGER));
					    appender.Append<Value>(Value(LogicalType::DOUBLE));
					    appender.Append<Value>(Value(LogicalType::DOUBLE));
				    }
				    appender.Append<double>(record.confidence);
				    appender.Append<bool>(record.interpolated);
				    if (record.transcript_index >= 0) {
					    appender.Append<int64_t>(record.transcript_index);
				    } else {
					    appender.Append<Value>(Value(LogicalType::BIGINT));
				    }
				    appender.EndRow();
			    }
		    }
		    appender.Close();
		    return true;
	    },
	    error);
}

bool DuckDBStore::FindAlignment(int64_t document_id, AlignmentResult &alignment, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	error.clear();
	auto header = Run(*con, "SELECT quality, matched_count, interpolated_count, total_count, audio_sentence_count,"
	                        " average_confidence, alignment_type FROM readalong_alignments WHERE document_id = $1",
	                        {Value::BIGINT(document_id)}, error);
	if (!header) {
		return false;
	}
	auto &header_rows = header->Cast<MaterializedQueryResult>();
	if (header_rows.RowCount() == 0) {
		return false;
	}

	alignment = AlignmentResult();
	alignment.document_id = document_id;
	alignment.quality = header_rows.GetValue(0, 0).GetValue<int32_t>();
	alignment.matched_count = header_rows.GetValue(1, 0).GetValue<int64_t>();
	alignment.interpolated_count = header_rows.GetValue(2, 0).GetValue<int64_t>();
	alignment.total_count = header_rows.GetValue(3, 0).GetValue<int64_t>();
	alignment.audio_sentence_count = header_rows.GetValue(4, 0).GetValue<int64_t>();
	alignment.average_confidence = header_rows.GetValue(5, 0).GetValue<double>();
	alignment.alignment_type = StringOrEmpty(header_rows.GetValue(6, 0));

	auto sentences = Run(*con, "SELECT page_number, index_in_page, sentence_id, text, x, y, width, height, chapter_index,"
	                           " global_start, global_end, confidence, interpolated, transcript_index"
	                           " FROM readalong_alignment_sentences WHERE document_id = $1"
	                           " ORDER BY page_number, index_in_page",
	                           {Value::BIGINT(document_id)}, error);
	if (!sentences) {
		return false;
	}
	auto &rows = sentences->Cast<MaterializedQueryResult>();
	for (idx_t row = 0; row < rows.RowCount(); row++) {
		AlignmentRecord record;
		record.page_number = rows.GetValue(0, row).GetValue<int32_t>();
		record.index_in_page = rows.GetValue(1, row).GetValue<int32_t>();
		record.id = rows.GetValue(2, row).GetValue<std::string>();
		record.text = rows.GetValue(3, row).GetValue<std::string>();
		record.position.x = rows.GetValue(4, row).GetValue<double>();
		record.position.y = rows.GetValue(5, row).GetValue<double>();
		record.position.width = rows.GetValue(6, row).GetValue<double>();
		record.position.height = rows.GetValue(7, row).GetValue<double>();
		Value chapter = rows.GetValue(8, row);
		record.has_audio = !chapter.IsNull();
		if (record.has_audio) {
			record.audio.chapter_index = chapter.GetValue<int32_t>();
			record.audio.global_start = rows.GetValue(9, row).GetValue<double>();
			record.audio.global_end = rows.GetValue(10, row).GetValue<double>();
		}
		record.confidence = rows.GetValue(11, row).GetValue<double>();
		record.interpolated = rows.GetValue(12, row).GetValue<bool>();
		Value transcript_index = rows.GetValue(13, row);
		record.transcript_index = transcript_index.IsNull() ? -1 : transcript_index.GetValue<int64_t>();

		if (alignment.pages.empty() || alignment.pages.back().page_number != record.page_number) {
			AlignmentPage page;
			page.page_number = record.page_number;
			alignment.pages.push_back(page);
		}
		alignment.pages.back().sentences.push_back(record);
	}
	return true;
}

bool DuckDBStore::ListChapters(int64_t book_id, std::vector<ChapterInfo> &chapters, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result = Run(*con, "SELECT book_id, chapter_index, file_path, duration_seconds FROM readalong_chapters"
	                        " WHERE book_id = $1 ORDER BY chapter_index",
	                        {Value::BIGINT(book_id)}, error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	chapters.clear();
	for (idx_t row = 0; row < rows.RowCount(); row++) {
		ChapterInfo chapter;
		chapter.book_id = rows.GetValue(0, row).GetValue<int64_t>();
		chapter.chapter_index = rows.GetValue(1, row).GetValue<int32_t>();
		chapter.file_path = rows.GetValue(2, row).GetValue<std::string>();
		Value duration = rows.GetValue(3, row);
		chapter.duration_seconds = duration.IsNull() ? 0.0 : duration.GetValue<double>();
		chapters.push_back(chapter);
	}
	return true;
}

bool DuckDBStore::FindDocument(int64_t document_id, DocumentInfo &document, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	error.clear();
	auto result = Run(*con, "SELECT document_id, book_id, file_path FROM readalong_documents WHERE document_id = $1",
	                        {Value::BIGINT(document_id)}, error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	if (rows.RowCount() == 0) {
		return false;
	}
	document.document_id = rows.GetValue(0, 0).GetValue<int64_t>();
	document.book_id = rows.GetValue(1, 0).GetValue<int64_t>();
	document.file_path = rows.GetValue(2, 0).GetValue<std::string>();
	return true;
}

bool DuckDBStore::UpdateDocument(int64_t document_id, int32_t page_count, bool is_scanned, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result = Run(*con, "UPDATE readalong_documents SET page_count = $2, is_scanned = $3 WHERE document_id = $1",
	                        {Value::BIGINT(document_id), Value::INTEGER(page_count), Value::BOOLEAN(is_scanned)}, error);
	return result != nullptr;
}

bool DuckDBStore::FindSetting(const std::string &key, std::string &value, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	error.clear();
	auto result = Run(*con, "SELECT value FROM readalong_settings WHERE key = $1", {Value(key)}, error);
	if (!result) {
		return false;
	}
	auto &rows = result->Cast<MaterializedQueryResult>();
	if (rows.RowCount() == 0) {
		return false;
	}
	value = StringOrEmpty(rows.GetValue(0, 0));
	return true;
}

bool DuckDBStore::PutSetting(const std::string &key, const std::string &value, std::string &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto con = Connect(error);
	if (!con) {
		return false;
	}
	auto result = Run(*con, "INSERT OR REPLACE INTO readalong_settings (key, value) VALUES ($1, $2)",
	                        {Value(key), Value(value)}, error);
	return result != nullptr;
}

} // namespace readalong
