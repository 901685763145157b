#pragma once

#include "backend_selector.hpp"
#include "duckdb_store.hpp"
#include "job_orchestrator.hpp"
#include "readalong_config.hpp"
#include "recognition_engine.hpp"
#include "text_extractor.hpp"

#include "duckdb.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace readalong {

// Everything one loaded database needs: store, backend, engines and the job worker
class ReadalongService : public std::enable_shared_from_this<ReadalongService> {
public:
	explicit ReadalongService(duckdb::DatabaseInstance &db);
	~ReadalongService();

	// Create the schema and load the persisted backend preference
	bool Initialize(std::string &error);

	// Backend preference read from readalong_settings, "auto" when none is stored
	std::string PersistedBackend() const;

	// Push session settings to the worker; resets backend detection when the model or
	// backend changed
	bool ApplyConfig(const ReadalongConfig &config, std::string &error);

	// Change and persist the backend preference
	bool SetBackend(BackendPreference preference, std::string &error);

	// Resume interrupted jobs and start the worker. The worker holds a reference to the
	// service, so callers must be owned through a shared_ptr.
	bool Start(std::string &error);
	// Ask the worker to exit without waiting for it
	void Shutdown();

	DuckDBStore &Store() {
		return store_;
	}
	BackendSelector &Selector() {
		return selector_;
	}
	RecognitionEngine &Recognition() {
		return recognition_;
	}
	JobOrchestrator &Orchestrator() {
		return orchestrator_;
	}

private:
	bool ResolveModel(const std::string &model_name, std::string &model_path, std::string &error);

	DuckDBStore store_;
	BackendSelector selector_;
	PdfTextExtractor extractor_;
	RecognitionEngine recognition_;
	JobOrchestrator orchestrator_;

	mutable std::mutex mutex_;
	std::string persisted_backend_;
	std::string applied_model_;
	std::string applied_backend_;
};

} // namespace readalong
