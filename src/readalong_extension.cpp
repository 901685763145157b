#define DUCKDB_EXTENSION_MAIN

#include "readalong_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

#include "readalong_config.hpp"
#include "readalong_functions.hpp"
#include "readalong_service.hpp"

#include "whisper.h"
#include <curl/curl.h>

namespace readalong {

using namespace duckdb;

ReadalongService &GetService(ExpressionState &state) {
	auto &func_expr = state.expr.Cast<BoundFunctionExpression>();
	return *func_expr.function.function_info->Cast<ReadalongScalarInfo>().service;
}

std::shared_ptr<ReadalongService> GetService(TableFunctionBindInput &input) {
	return input.info->Cast<ReadalongTableInfo>().service;
}

void AttachService(ScalarFunction &function, const std::shared_ptr<ReadalongService> &service) {
	function.function_info = make_shared_ptr<ReadalongScalarInfo>(service);
}

void AttachService(TableFunction &function, const std::shared_ptr<ReadalongService> &service) {
	function.function_info = make_shared_ptr<ReadalongTableInfo>(service);
}

ReadalongConfig ApplySessionConfig(ClientContext &context, ReadalongService &service) {
	auto config = ReadalongConfigManager::GetConfig(context);
	std::string error;
	if (!service.ApplyConfig(config, error)) {
		throw InvalidInputException(error);
	}
	return config;
}

// readalong_version() - extension and whisper.cpp version info
static void ReadalongVersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	std::string version_info = "readalong extension v" + ReadalongExtension().Version() +
	                           " (whisper.cpp: " + std::string(whisper_version()) + ")";
	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::SetNull(result, false);
	auto result_data = ConstantVector::GetData<string_t>(result);
	*result_data = StringVector::AddString(result, version_info);
}

static void LoadInternal(ExtensionLoader &loader) {
	// Initialize libcurl globally (required before any curl operations)
	curl_global_init(CURL_GLOBAL_DEFAULT);

	auto &db = loader.GetDatabaseInstance();

	// Owned by the worker thread and by the registered functions. When the database drops
	// its functions the worker is told to exit and releases the service itself.
	auto owned = std::make_shared<ReadalongService>(db);
	std::shared_ptr<ReadalongService> service(owned.get(), [owned](ReadalongService *) { owned->Shutdown(); });
	std::string error;
	if (!service->Initialize(error)) {
		throw IOException("Failed to initialize readalong tables: " + error);
	}

	// Register configuration settings FIRST
	ReadalongConfigManager::RegisterSettings(db, service->PersistedBackend());

	RegisterJobFunctions(loader, service);
	RegisterResultFunctions(loader, service);
	RegisterModelFunctions(loader, service);

	auto version_func = ScalarFunction("readalong_version", {}, LogicalType::VARCHAR, ReadalongVersionFunction);
	loader.RegisterFunction(version_func);

	if (!service->Start(error)) {
		throw IOException("Failed to resume readalong jobs: " + error);
	}
}

void ReadalongExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string ReadalongExtension::Name() {
	return "readalong";
}

std::string ReadalongExtension::Version() const {
#ifdef EXT_VERSION_READALONG
	return EXT_VERSION_READALONG;
#else
	return "0.1.0";
#endif
}

} // namespace readalong

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(readalong, loader) {
	readalong::LoadInternal(loader);
}
}
