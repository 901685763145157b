#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"

#include "duckdb/common/exception.hpp"

#include "alignment_json.hpp"
#include "readalong_functions.hpp"

namespace readalong {

using namespace duckdb;

struct SubjectBindData : public TableFunctionData {
	std::shared_ptr<ReadalongService> service;
	int64_t subject_id;
};

static unique_ptr<SubjectBindData> BindSubject(TableFunctionBindInput &input) {
	auto bind_data = make_uniq<SubjectBindData>();
	bind_data->service = GetService(input);
	bind_data->subject_id = input.inputs[0].GetValue<int64_t>();
	return bind_data;
}

// ============================================================================
// readalong_alignment(document_id) - One row per document sentence
// ============================================================================

struct AlignmentState : public GlobalTableFunctionState {
	std::vector<AlignmentRecord> records;
	idx_t current_idx;

	AlignmentState() : current_idx(0) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> AlignmentBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSubject(input);

	return_types.push_back(LogicalType::INTEGER);
	names.push_back("page_number");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("sentence_id");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("text");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("x");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("y");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("width");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("height");

	return_types.push_back(LogicalType::INTEGER);
	names.push_back("chapter_index");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("global_start");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("global_end");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("confidence");

	return_types.push_back(LogicalType::BOOLEAN);
	names.push_back("interpolated");

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> AlignmentInit(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<SubjectBindData>();
	auto state = make_uniq<AlignmentState>();

	AlignmentResult alignment;
	std::string error;
	if (!bind_data.service->Store().FindAlignment(bind_data.subject_id, alignment, error)) {
		if (!error.empty()) {
			throw IOException("Failed to read alignment: " + error);
		}
		return std::move(state);
	}
	for (auto &page : alignment.pages) {
		for (auto &record : page.sentences) {
			state->records.push_back(record);
		}
	}
	return std::move(state);
}

static void AlignmentExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<AlignmentState>();

	idx_t output_idx = 0;
	while (state.current_idx < state.records.size() && output_idx < STANDARD_VECTOR_SIZE) {
		const auto &record = state.records[state.current_idx];

		output.SetValue(0, output_idx, Value::INTEGER(record.page_number));
		output.SetValue(1, output_idx, Value(record.id));
		output.SetValue(2, output_idx, Value(record.text));
		output.SetValue(3, output_idx, Value::DOUBLE(record.position.x));
		output.SetValue(4, output_idx, Value::DOUBLE(record.position.y));
		output.SetValue(5, output_idx, Value::DOUBLE(record.position.width));
		output.SetValue(6, output_idx, Value::DOUBLE(record.position.height));
		if (record.has_audio) {
			output.SetValue(7, output_idx, Value::INTEGER(record.audio.chapter_index));
			output.SetValue(8, output_idx, Value::DOUBLE(record.audio.global_start));
			output.SetValue(9, output_idx, Value::DOUBLE(record.audio.global_end));
		} else {
			output.SetValue(7, output_idx, Value());
			output.SetValue(8, output_idx, Value());
			output.SetValue(9, output_idx, Value());
		}
		output.SetValue(10, output_idx, Value::DOUBLE(record.confidence));
		output.SetValue(11, output_idx, Value::BOOLEAN(record.interpolated));

		state.current_idx++;
		output_idx++;
	}

	output.SetCardinality(output_idx);
}

// ============================================================================
// readalong_alignment_json(document_id) - Alignment as a JSON document
// ============================================================================

static void AlignmentJsonFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &service = GetService(state);

	UnaryExecutor::ExecuteWithNulls<int64_t, string_t>(
	    args.data[0], result, args.size(), [&](int64_t document_id, ValidityMask &mask, idx_t idx) {
		    AlignmentResult alignment;
		    std::string error;
		    if (!service.Store().FindAlignment(document_id, alignment, error)) {
			    if (!error.empty()) {
				    throw IOException("Failed to read alignment: " + error);
			    }
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    return StringVector::AddString(result, RenderAlignmentJson(alignment));
	    });
}

// ============================================================================
// readalong_transcript(book_id) - Cached book transcript on the global timeline
// ============================================================================

struct TranscriptState : public GlobalTableFunctionState {
	BookTranscript transcript;
	idx_t current_idx;

	TranscriptState() : current_idx(0) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> TranscriptBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSubject(input);

	return_types.push_back(LogicalType::BIGINT);
	names.push_back("sentence_index");

	return_types.push_back(LogicalType::INTEGER);
	names.push_back("chapter_index");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("text");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("start_time");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("end_time");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("global_start");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("global_end");

	return_types.push_back(LogicalType::BOOLEAN);
	names.push_back("is_synthetic");

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> TranscriptInit(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<SubjectBindData>();
	auto state = make_uniq<TranscriptState>();

	std::string error;
	if (!bind_data.service->Recognition().LoadBookTranscript(bind_data.subject_id, state->transcript, error) &&
	    !error.empty()) {
		throw IOException("Failed to read transcript: " + error);
	}
	return std::move(state);
}

static void TranscriptExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<TranscriptState>();
	const auto &sentences = state.transcript.sentences;

	idx_t output_idx = 0;
	while (state.current_idx < sentences.size() && output_idx < STANDARD_VECTOR_SIZE) {
		const auto &sentence = sentences[state.current_idx];

		output.SetValue(0, output_idx, Value::BIGINT(static_cast<int64_t>(state.current_idx)));
		output.SetValue(1, output_idx, Value::INTEGER(sentence.chapter_index));
		output.SetValue(2, output_idx, Value(sentence.text));
		output.SetValue(3, output_idx, Value::DOUBLE(sentence.start));
		output.SetValue(4, output_idx, Value::DOUBLE(sentence.end));
		output.SetValue(5, output_idx, Value::DOUBLE(sentence.global_start));
		output.SetValue(6, output_idx, Value::DOUBLE(sentence.global_end));
		output.SetValue(7, output_idx, Value::BOOLEAN(sentence.is_synthetic));

		state.current_idx++;
		output_idx++;
	}

	output.SetCardinality(output_idx);
}

// ============================================================================
// readalong_delete_transcripts(book_id) - Drop cached chapter transcripts
// ============================================================================

static void DeleteTranscriptsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &service = GetService(state);

	UnaryExecutor::Execute<int64_t, int64_t>(args.data[0], result, args.size(), [&](int64_t book_id) {
		int64_t deleted = 0;
		std::string error;
		if (!service.Recognition().InvalidateBook(book_id, deleted, error)) {
			throw IOException("Failed to delete transcripts: " + error);
		}
		return deleted;
	});
}

// ============================================================================
// Registration
// ============================================================================

void RegisterResultFunctions(ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service) {
	// readalong_alignment(document_id)
	TableFunction alignment("readalong_alignment", {LogicalType::BIGINT}, AlignmentExecute, AlignmentBind,
	                        AlignmentInit);
	AttachService(alignment, service);
	loader.RegisterFunction(alignment);

	// readalong_alignment_json(document_id)
	auto json_func = ScalarFunction("readalong_alignment_json", {LogicalType::BIGINT}, LogicalType::VARCHAR,
	                                AlignmentJsonFunction);
	json_func.stability = FunctionStability::VOLATILE;
	AttachService(json_func, service);
	loader.RegisterFunction(json_func);

	// readalong_transcript(book_id)
	TableFunction transcript("readalong_transcript", {LogicalType::BIGINT}, TranscriptExecute, TranscriptBind,
	                         TranscriptInit);
	AttachService(transcript, service);
	loader.RegisterFunction(transcript);

	// readalong_delete_transcripts(book_id)
	auto delete_func = ScalarFunction("readalong_delete_transcripts", {LogicalType::BIGINT}, LogicalType::BIGINT,
	                                  DeleteTranscriptsFunction);
	delete_func.stability = FunctionStability::VOLATILE;
	AttachService(delete_func, service);
	loader.RegisterFunction(delete_func);
}

} // namespace readalong
