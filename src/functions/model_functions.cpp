#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/main/config.hpp"

#include "model_manager.hpp"
#include "readalong_config.hpp"
#include "readalong_functions.hpp"

namespace readalong {

using namespace duckdb;

// ============================================================================
// readalong_list_models() - Table function listing all available models
// ============================================================================

struct ListModelsState : public GlobalTableFunctionState {
	std::vector<ModelInfo> models;
	idx_t current_idx;

	ListModelsState() : current_idx(0) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> ListModelsBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
	return_types.push_back(LogicalType::VARCHAR); // name
	names.push_back("name");

	return_types.push_back(LogicalType::BOOLEAN); // is_downloaded
	names.push_back("is_downloaded");

	return_types.push_back(LogicalType::BIGINT); // file_size
	names.push_back("file_size");

	return_types.push_back(LogicalType::VARCHAR); // file_path
	names.push_back("file_path");

	return_types.push_back(LogicalType::VARCHAR); // description
	names.push_back("description");

	return nullptr;
}

static unique_ptr<GlobalTableFunctionState> ListModelsInit(ClientContext &context, TableFunctionInitInput &input) {
	auto state = make_uniq<ListModelsState>();
	auto config = ReadalongConfigManager::GetConfig(context);
	state->models = ModelManager::ListModels(config.model_path);
	return std::move(state);
}

static void ListModelsExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<ListModelsState>();

	idx_t output_idx = 0;
	while (state.current_idx < state.models.size() && output_idx < STANDARD_VECTOR_SIZE) {
		const auto &model = state.models[state.current_idx];

		output.SetValue(0, output_idx, Value(model.name));
		output.SetValue(1, output_idx, Value::BOOLEAN(model.is_downloaded));
		output.SetValue(2, output_idx, model.is_downloaded ? Value::BIGINT(model.file_size) : Value());
		output.SetValue(3, output_idx, Value(model.file_path));
		output.SetValue(4, output_idx, Value(model.description));

		state.current_idx++;
		output_idx++;
	}

	output.SetCardinality(output_idx);
}

// ============================================================================
// readalong_download_model(model_name) - Scalar function to download a model
// ============================================================================

static void DownloadModelFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &context = state.GetContext();
	auto config = ReadalongConfigManager::GetConfig(context);

	auto &model_name_vec = args.data[0];
	idx_t count = args.size();

	UnaryExecutor::Execute<string_t, string_t>(model_name_vec, result, count, [&](string_t model_name_val) {
		std::string model_name = model_name_val.GetString();
		std::string error;

		if (!ModelManager::IsValidModelName(model_name)) {
			throw InvalidInputException("Invalid model name: " + model_name +
			                            ". Use readalong_list_models() to see available models.");
		}

		if (ModelManager::IsModelDownloaded(model_name, config.model_path)) {
			return StringVector::AddString(result, "Model '" + model_name + "' is already downloaded");
		}

		LogStatus(config, "Downloading model '" + model_name + "'...");
		if (!ModelManager::DownloadModel(model_name, config.model_path, config.model_base_url, error)) {
			throw IOException("Failed to download model: " + error);
		}

		return StringVector::AddString(result, "Successfully downloaded model '" + model_name + "'");
	});
}

// ============================================================================
// readalong_backend_status() - Table function showing backend and model state
// ============================================================================

struct BackendStatusBindData : public TableFunctionData {
	std::shared_ptr<ReadalongService> service;
};

struct BackendStatusState : public GlobalTableFunctionState {
	BackendStatus status;
	bool returned;

	BackendStatusState() : returned(false) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> BackendStatusBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<BackendStatusBindData>();
	bind_data->service = GetService(input);

	return_types.push_back(LogicalType::VARCHAR); // backend
	names.push_back("backend");

	return_types.push_back(LogicalType::BOOLEAN); // gpu
	names.push_back("gpu");

	return_types.push_back(LogicalType::VARCHAR); // variant
	names.push_back("variant");

	return_types.push_back(LogicalType::VARCHAR); // reason
	names.push_back("reason");

	return_types.push_back(LogicalType::VARCHAR); // preference
	names.push_back("preference");

	return_types.push_back(LogicalType::VARCHAR); // platform
	names.push_back("platform");

	return_types.push_back(LogicalType::VARCHAR); // model
	names.push_back("model");

	return_types.push_back(LogicalType::VARCHAR); // model_path
	names.push_back("model_path");

	return_types.push_back(LogicalType::BOOLEAN); // model_present
	names.push_back("model_present");

	return_types.push_back(LogicalType::BOOLEAN); // engine_loaded
	names.push_back("engine_loaded");

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> BackendStatusInit(ClientContext &context,
                                                              TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<BackendStatusBindData>();
	auto state = make_uniq<BackendStatusState>();
	auto config = ReadalongConfigManager::GetConfig(context);
	state->status = bind_data.service->Selector().Status(config.model, config.model_path);
	return std::move(state);
}

static void BackendStatusExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<BackendStatusState>();

	if (state.returned) {
		output.SetCardinality(0);
		return;
	}

	const auto &status = state.status;
	output.SetValue(0, 0, Value(status.backend.name));
	output.SetValue(1, 0, Value::BOOLEAN(status.backend.gpu));
	output.SetValue(2, 0, status.backend.variant.empty() ? Value() : Value(status.backend.variant));
	output.SetValue(3, 0, Value(status.backend.reason));
	output.SetValue(4, 0, Value(status.preference));
	output.SetValue(5, 0, Value(status.platform));
	output.SetValue(6, 0, Value(status.model));
	output.SetValue(7, 0, Value(status.model_path));
	output.SetValue(8, 0, Value::BOOLEAN(status.model_present));
	output.SetValue(9, 0, Value::BOOLEAN(status.engine_loaded));

	output.SetCardinality(1);
	state.returned = true;
}

// ============================================================================
// readalong_set_backend(preference) / readalong_reset_backend()
// ============================================================================

static void SetBackendFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &context = state.GetContext();
	auto &service = GetService(state);

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t preference_val) {
		std::string name = preference_val.GetString();
		BackendPreference preference;
		if (!BackendPreferenceFromString(name, preference)) {
			throw InvalidInputException("Invalid backend: " + name + ". Use auto, metal, cuda, vulkan or cpu.");
		}

		std::string error;
		if (!service.SetBackend(preference, error)) {
			throw IOException("Failed to persist backend preference: " + error);
		}
		// Keep the global setting in line so later jobs do not switch back
		DBConfig::GetConfig(context).SetOptionByName("readalong_backend", Value(name));

		auto backend = service.Selector().Detect();
		return StringVector::AddString(result, "Backend set to '" + name + "' (using " + backend.name + ", " +
		                                           backend.reason + ")");
	});
}

static void ResetBackendFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &service = GetService(state);
	service.Selector().ResetBackendDetection();
	auto backend = service.Selector().Detect();

	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::SetNull(result, false);
	auto result_data = ConstantVector::GetData<string_t>(result);
	*result_data = StringVector::AddString(result, "Backend detection reset (using " + backend.name + ", " +
	                                                   backend.reason + ")");
}

// ============================================================================
// Registration
// ============================================================================

void RegisterModelFunctions(ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service) {
	// readalong_list_models()
	TableFunction list_models("readalong_list_models", {}, ListModelsExecute, ListModelsBind, ListModelsInit);
	loader.RegisterFunction(list_models);

	// readalong_download_model(model_name)
	auto download_func = ScalarFunction("readalong_download_model", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                                    DownloadModelFunction);
	download_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(download_func);

	// readalong_backend_status()
	TableFunction backend_status("readalong_backend_status", {}, BackendStatusExecute, BackendStatusBind,
	                             BackendStatusInit);
	AttachService(backend_status, service);
	loader.RegisterFunction(backend_status);

	// readalong_set_backend(preference)
	auto set_func = ScalarFunction("readalong_set_backend", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                               SetBackendFunction);
	set_func.stability = FunctionStability::VOLATILE;
	AttachService(set_func, service);
	loader.RegisterFunction(set_func);

	// readalong_reset_backend()
	auto reset_func =
	    ScalarFunction("readalong_reset_backend", {}, LogicalType::VARCHAR, ResetBackendFunction);
	reset_func.stability = FunctionStability::VOLATILE;
	AttachService(reset_func, service);
	loader.RegisterFunction(reset_func);
}

} // namespace readalong
