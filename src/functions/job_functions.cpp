#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"

#include "duckdb/common/exception.hpp"

#include "readalong_functions.hpp"

namespace readalong {

using namespace duckdb;

static JobKind ParseKind(const std::string &kind_name) {
	JobKind kind;
	if (!JobKindFromString(kind_name, kind)) {
		throw InvalidInputException("Invalid job kind: " + kind_name + ". Use 'book' or 'document'.");
	}
	return kind;
}

// ============================================================================
// readalong_start_job(kind, subject_id) - Queue a job, or return the active one
// ============================================================================

static void StartJobFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &service = GetService(state);
	ApplySessionConfig(state.GetContext(), service);

	BinaryExecutor::Execute<string_t, int64_t, int64_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t kind_val, int64_t subject_id) {
		    JobKind kind = ParseKind(kind_val.GetString());
		    TranscriptionJob job;
		    std::string error;
		    if (!service.Orchestrator().StartJob(kind, subject_id, job, error)) {
			    throw InvalidInputException("Failed to start job: " + error);
		    }
		    return job.id;
	    });
}

// ============================================================================
// readalong_cancel_job(job_id) - Cancel a queued or running job
// ============================================================================

static void CancelJobFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &service = GetService(state);

	UnaryExecutor::Execute<int64_t, string_t>(args.data[0], result, args.size(), [&](int64_t job_id) {
		CancelOutcome outcome;
		std::string error;
		if (!service.Orchestrator().Cancel(job_id, outcome, error)) {
			throw IOException("Failed to cancel job " + std::to_string(job_id) + ": " + error);
		}
		return StringVector::AddString(result, CancelOutcomeToString(outcome));
	});
}

// ============================================================================
// readalong_job_status(job_id) / readalong_subject_status(kind, subject_id)
// ============================================================================

struct JobStatusBindData : public TableFunctionData {
	std::shared_ptr<ReadalongService> service;
	bool by_subject;
	int64_t job_id;
	JobKind kind;
	int64_t subject_id;
};

struct JobStatusState : public GlobalTableFunctionState {
	TranscriptionJob job;
	bool found;
	bool returned;

	JobStatusState() : found(false), returned(false) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static void AddJobColumns(vector<LogicalType> &return_types, vector<string> &names) {
	return_types.push_back(LogicalType::BIGINT);
	names.push_back("job_id");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("kind");

	return_types.push_back(LogicalType::BIGINT);
	names.push_back("subject_id");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("status");

	return_types.push_back(LogicalType::INTEGER);
	names.push_back("progress");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("status_message");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("error_message");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("created_at");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("updated_at");
}

static Value OptionalText(const std::string &text) {
	return text.empty() ? Value(LogicalType::VARCHAR) : Value(text);
}

static unique_ptr<FunctionData> JobStatusBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<JobStatusBindData>();
	bind_data->service = GetService(input);
	bind_data->by_subject = false;
	bind_data->job_id = input.inputs[0].GetValue<int64_t>();
	bind_data->kind = JobKind::BOOK;
	bind_data->subject_id = 0;
	AddJobColumns(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> SubjectStatusBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<JobStatusBindData>();
	bind_data->service = GetService(input);
	bind_data->by_subject = true;
	bind_data->job_id = 0;
	bind_data->kind = ParseKind(input.inputs[0].GetValue<string>());
	bind_data->subject_id = input.inputs[1].GetValue<int64_t>();
	AddJobColumns(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> JobStatusInit(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<JobStatusBindData>();
	auto state = make_uniq<JobStatusState>();
	auto &store = bind_data.service->Store();

	std::string error;
	if (bind_data.by_subject) {
		state->found = store.FindLatestJob(bind_data.kind, bind_data.subject_id, state->job, error);
	} else {
		state->found = store.FindJob(bind_data.job_id, state->job, error);
	}
	if (!state->found && !error.empty()) {
		throw IOException("Failed to read job status: " + error);
	}
	return std::move(state);
}

static void JobStatusExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<JobStatusState>();

	if (state.returned || !state.found) {
		output.SetCardinality(0);
		return;
	}

	const auto &job = state.job;
	output.SetValue(0, 0, Value::BIGINT(job.id));
	output.SetValue(1, 0, Value(JobKindToString(job.kind)));
	output.SetValue(2, 0, Value::BIGINT(job.subject_id));
	output.SetValue(3, 0, Value(JobStatusToString(job.status)));
	output.SetValue(4, 0, Value::INTEGER(job.progress));
	output.SetValue(5, 0, OptionalText(job.status_message));
	output.SetValue(6, 0, OptionalText(job.error_message));
	output.SetValue(7, 0, Value(job.created_at));
	output.SetValue(8, 0, Value(job.updated_at));

	output.SetCardinality(1);
	state.returned = true;
}

// ============================================================================
// Registration
// ============================================================================

void RegisterJobFunctions(ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service) {
	// readalong_start_job(kind, subject_id)
	auto start_func = ScalarFunction("readalong_start_job", {LogicalType::VARCHAR, LogicalType::BIGINT},
	                                 LogicalType::BIGINT, StartJobFunction);
	start_func.stability = FunctionStability::VOLATILE;
	AttachService(start_func, service);
	loader.RegisterFunction(start_func);

	// readalong_cancel_job(job_id)
	auto cancel_func =
	    ScalarFunction("readalong_cancel_job", {LogicalType::BIGINT}, LogicalType::VARCHAR, CancelJobFunction);
	cancel_func.stability = FunctionStability::VOLATILE;
	AttachService(cancel_func, service);
	loader.RegisterFunction(cancel_func);

	// readalong_job_status(job_id)
	TableFunction job_status("readalong_job_status", {LogicalType::BIGINT}, JobStatusExecute, JobStatusBind,
	                         JobStatusInit);
	AttachService(job_status, service);
	loader.RegisterFunction(job_status);

	// readalong_subject_status(kind, subject_id)
	TableFunction subject_status("readalong_subject_status", {LogicalType::VARCHAR, LogicalType::BIGINT},
	                             JobStatusExecute, SubjectStatusBind, JobStatusInit);
	AttachService(subject_status, service);
	loader.RegisterFunction(subject_status);
}

} // namespace readalong
