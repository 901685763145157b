#include "readalong_service.hpp"
#include "audio_utils.hpp"
#include "model_manager.hpp"
#include "whisper_context.hpp"

namespace readalong {

static const char *const BACKEND_SETTING = "backend";

ReadalongService::ReadalongService(duckdb::DatabaseInstance &db)
    : store_(db),
      selector_(PlatformInfo::Current(), DefaultBackendProbes(PlatformInfo::Current()),
                BackendSelector::WhisperEngineFactory(),
                [this](const std::string &model_name, std::string &model_path, std::string &error) {
	                return ResolveModel(model_name, model_path, error);
                }),
      recognition_(selector_, store_, store_), orchestrator_(store_, store_, store_, recognition_, extractor_),
      persisted_backend_(ReadalongConfig::DEFAULT_BACKEND) {
}

ReadalongService::~ReadalongService() {
	orchestrator_.Stop();
}

bool ReadalongService::Initialize(std::string &error) {
	if (!store_.Initialize(error)) {
		return false;
	}

	std::string stored;
	if (!store_.FindSetting(BACKEND_SETTING, stored, error)) {
		if (!error.empty()) {
			return false;
		}
		stored = ReadalongConfig::DEFAULT_BACKEND;
	}

	BackendPreference preference;
	if (!BackendPreferenceFromString(stored, preference)) {
		LogError("Ignoring unknown persisted backend '" + stored + "'");
		preference = BackendPreference::AUTO;
		stored = ReadalongConfig::DEFAULT_BACKEND;
	}
	selector_.SetPreference(preference);

	ReadalongConfig config;
	config.backend = stored;
	orchestrator_.UpdateConfig(config);

	std::lock_guard<std::mutex> lock(mutex_);
	persisted_backend_ = stored;
	applied_model_ = config.model;
	applied_backend_ = stored;
	return true;
}

std::string ReadalongService::PersistedBackend() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return persisted_backend_;
}

bool ReadalongService::ApplyConfig(const ReadalongConfig &config, std::string &error) {
	if (!config.Validate(error)) {
		return false;
	}
	BackendPreference preference;
	if (!BackendPreferenceFromString(config.backend, preference)) {
		error = "Invalid readalong_backend '" + config.backend + "'. Use auto, metal, cuda, vulkan or cpu.";
		return false;
	}

	AudioUtils::SetFFmpegLogging(config.ffmpeg_logging);
	WhisperContextWrapper::ConfigureLogging(config.verbose);
	orchestrator_.UpdateConfig(config);

	std::lock_guard<std::mutex> lock(mutex_);
	if (config.backend != applied_backend_) {
		LogStatus(config, "Backend preference changed to " + config.backend);
		selector_.SetPreference(preference);
		selector_.ResetBackendDetection();
	} else if (config.model != applied_model_) {
		LogStatus(config, "Model changed to " + config.model);
		selector_.ResetBackendDetection();
	}
	applied_backend_ = config.backend;
	applied_model_ = config.model;
	return true;
}

bool ReadalongService::SetBackend(BackendPreference preference, std::string &error) {
	std::string name = BackendPreferenceToString(preference);
	if (!store_.PutSetting(BACKEND_SETTING, name, error)) {
		return false;
	}
	selector_.SetPreference(preference);
	selector_.ResetBackendDetection();

	std::lock_guard<std::mutex> lock(mutex_);
	persisted_backend_ = name;
	applied_backend_ = name;
	return true;
}

bool ReadalongService::Start(std::string &error) {
	size_t resumed = 0;
	if (!orchestrator_.ResumePendingJobs(resumed, error)) {
		return false;
	}
	orchestrator_.Start(shared_from_this());
	return true;
}

void ReadalongService::Shutdown() {
	orchestrator_.RequestStop();
}

bool ReadalongService::ResolveModel(const std::string &model_name, std::string &model_path, std::string &error) {
	ReadalongConfig config = orchestrator_.GetConfig();
	if (ModelManager::IsValidModelName(model_name) && !ModelManager::IsModelDownloaded(model_name, config.model_path)) {
		LogStatus(config, "Downloading model '" + model_name + "'...");
	}
	return ModelManager::EnsureModel(model_name, config.model_path, config.model_base_url, model_path, error);
}

} // namespace readalong
