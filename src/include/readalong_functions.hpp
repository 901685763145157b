#pragma once

#include "readalong_config.hpp"
#include "readalong_service.hpp"

#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include <memory>

namespace readalong {

// Carries the per-database service into scalar functions
struct ReadalongScalarInfo : public duckdb::ScalarFunctionInfo {
	explicit ReadalongScalarInfo(std::shared_ptr<ReadalongService> service_p) : service(std::move(service_p)) {
	}
	std::shared_ptr<ReadalongService> service;
};

// Carries the per-database service into table functions
struct ReadalongTableInfo : public duckdb::TableFunctionInfo {
	explicit ReadalongTableInfo(std::shared_ptr<ReadalongService> service_p) : service(std::move(service_p)) {
	}
	std::shared_ptr<ReadalongService> service;
};

ReadalongService &GetService(duckdb::ExpressionState &state);
std::shared_ptr<ReadalongService> GetService(duckdb::TableFunctionBindInput &input);

// Attach the service to a function before registering it
void AttachService(duckdb::ScalarFunction &function, const std::shared_ptr<ReadalongService> &service);
void AttachService(duckdb::TableFunction &function, const std::shared_ptr<ReadalongService> &service);

// Read the session settings and hand them to the background worker
ReadalongConfig ApplySessionConfig(duckdb::ClientContext &context, ReadalongService &service);

void RegisterJobFunctions(duckdb::ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service);
void RegisterResultFunctions(duckdb::ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service);
void RegisterModelFunctions(duckdb::ExtensionLoader &loader, const std::shared_ptr<ReadalongService> &service);

} // namespace readalong
