#include "backend_selector.hpp"
#include "model_manager.hpp"
#include "whisper_context.hpp"
#include "ggml-backend.h"

#include <mutex>

namespace readalong {

std::string BackendPreferenceToString(BackendPreference preference) {
	switch (preference) {
	case BackendPreference::AUTO:
		return "auto";
	case BackendPreference::METAL:
		return "metal";
	case BackendPreference::CUDA:
		return "cuda";
	case BackendPreference::VULKAN:
		return "vulkan";
	case BackendPreference::CPU:
		return "cpu";
	}
	return "auto";
}

bool BackendPreferenceFromString(const std::string &str, BackendPreference &preference) {
	static const BackendPreference ALL[] = {BackendPreference::AUTO, BackendPreference::METAL, BackendPreference::CUDA,
	                                        BackendPreference::VULKAN, BackendPreference::CPU};
	for (auto candidate : ALL) {
		if (BackendPreferenceToString(candidate) == str) {
			preference = candidate;
			return true;
		}
	}
	return false;
}

PlatformInfo PlatformInfo::Current() {
	PlatformInfo info;
#if defined(__APPLE__)
	info.os = "darwin";
#elif defined(_WIN32)
	info.os = "win32";
#elif defined(__linux__)
	info.os = "linux";
#else
	info.os = "unknown";
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
	info.arch = "arm64";
#elif defined(__x86_64__) || defined(_M_X64)
	info.arch = "x64";
#else
	info.arch = "unknown";
#endif
	return info;
}

std::string PlatformInfo::ToString() const {
	return os + "-" + arch;
}

MetalProbe::MetalProbe(PlatformInfo platform) : platform_(std::move(platform)) {
}

std::string MetalProbe::Name() const {
	return "metal";
}

bool MetalProbe::IsAvailable() const {
	return platform_.os == "darwin" && platform_.arch == "arm64";
}

GgmlRegistryProbe::GgmlRegistryProbe(std::string name, std::string registry_name)
    : name_(std::move(name)), registry_name_(std::move(registry_name)) {
}

std::string GgmlRegistryProbe::Name() const {
	return name_;
}

bool GgmlRegistryProbe::IsAvailable() const {
	// Dynamic-backend builds register nothing until the backend libraries are loaded
	static std::once_flag load_flag;
	std::call_once(load_flag, []() { ggml_backend_load_all(); });

	ggml_backend_reg_t reg = ggml_backend_reg_by_name(registry_name_.c_str());
	return reg != nullptr && ggml_backend_reg_dev_count(reg) > 0;
}

std::string CpuProbe::Name() const {
	return "cpu";
}

bool CpuProbe::IsAvailable() const {
	return true;
}

std::vector<std::shared_ptr<BackendProbe>> DefaultBackendProbes(const PlatformInfo &platform) {
	std::vector<std::shared_ptr<BackendProbe>> probes;
	probes.push_back(std::make_shared<MetalProbe>(platform));
	probes.push_back(std::make_shared<GgmlRegistryProbe>("cuda", "CUDA"));
	probes.push_back(std::make_shared<GgmlRegistryProbe>("vulkan", "Vulkan"));
	probes.push_back(std::make_shared<CpuProbe>());
	return probes;
}

static BackendDescriptor MakeDescriptor(const std::string &name, const std::string &reason) {
	BackendDescriptor descriptor;
	descriptor.name = name;
	descriptor.gpu = name != "cpu";
	// CUDA and Vulkan ship as separate builds; Metal is part of the default macOS build
	descriptor.variant = (name == "cuda" || name == "vulkan") ? name : "";
	descriptor.reason = reason;
	return descriptor;
}

BackendSelector::BackendSelector(PlatformInfo platform, std::vector<std::shared_ptr<BackendProbe>> probes,
                                 EngineFactory factory, ModelResolver resolver)
    : platform_(std::move(platform)), probes_(std::move(probes)), factory_(std::move(factory)),
      resolver_(std::move(resolver)), preference_(BackendPreference::AUTO), detected_(false) {
}

EngineFactory BackendSelector::WhisperEngineFactory() {
	return [](const std::string &model_path, const BackendDescriptor &backend, std::string &error) {
		return WhisperContextWrapper::Create(model_path, backend.gpu, error);
	};
}

void BackendSelector::SetPreference(BackendPreference preference) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (preference == preference_) {
		return;
	}
	preference_ = preference;
	detected_ = false;
	engine_.reset();
	engine_model_.clear();
}

BackendPreference BackendSelector::GetPreference() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return preference_;
}

bool BackendSelector::ProbeAvailable(const std::string &name) const {
	for (const auto &probe : probes_) {
		if (probe->Name() == name) {
			return probe->IsAvailable();
		}
	}
	return false;
}

BackendDescriptor BackendSelector::AutoDetect() const {
	if (platform_.os == "darwin") {
		if (platform_.arch == "arm64") {
			return MakeDescriptor("metal", "auto-detected (macOS Apple Silicon)");
		}
		return MakeDescriptor("cpu", "auto-detected (macOS Intel - no Metal)");
	}
	if (platform_.os == "linux" || platform_.os == "win32") {
		if (ProbeAvailable("cuda")) {
			return MakeDescriptor("cuda", "auto-detected (CUDA available)");
		}
		if (ProbeAvailable("vulkan")) {
			return MakeDescriptor("vulkan", "auto-detected (Vulkan available)");
		}
		return MakeDescriptor("cpu", "auto-detected (no GPU variant found)");
	}
	return MakeDescriptor("cpu", "auto-detected (unknown platform)");
}

BackendDescriptor BackendSelector::DetectLocked() {
	if (detected_) {
		return backend_;
	}
	if (preference_ == BackendPreference::AUTO) {
		backend_ = AutoDetect();
	} else {
		backend_ = MakeDescriptor(BackendPreferenceToString(preference_), "manual override");
	}
	detected_ = true;
	return backend_;
}

BackendDescriptor BackendSelector::Detect() {
	std::lock_guard<std::mutex> lock(mutex_);
	return DetectLocked();
}

bool BackendSelector::EnsureModel(const std::string &model_name, std::string &model_path, std::string &error) {
	return resolver_(model_name, model_path, error);
}

std::shared_ptr<EngineHandle> BackendSelector::GetEngineContext(const std::string &model_name, std::string &error) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (engine_ && engine_model_ == model_name) {
			return engine_;
		}
		// Release the old model before loading the next one
		engine_.reset();
		engine_model_.clear();
	}

	// Resolving may download the model; detection and status stay available meanwhile
	std::string model_path;
	if (!resolver_(model_name, model_path, error)) {
		return nullptr;
	}

	std::lock_guard<std::mutex> lock(mutex_);
	if (engine_ && engine_model_ == model_name) {
		return engine_;
	}
	engine_.reset();
	engine_model_.clear();

	BackendDescriptor backend = DetectLocked();
	std::string init_error;
	std::unique_ptr<EngineHandle> engine = factory_(model_path, backend, init_error);

	if (!engine && backend.gpu) {
		BackendDescriptor cpu = MakeDescriptor("cpu", "fallback after GPU failure");
		std::string cpu_error;
		engine = factory_(model_path, cpu, cpu_error);
		if (!engine) {
			error = "Engine initialization failed on " + backend.name + " (" + init_error + ") and on CPU (" +
			        cpu_error + ")";
			return nullptr;
		}
		backend_ = cpu;
	} else if (!engine) {
		error = "Engine initialization failed on " + backend.name + ": " + init_error;
		return nullptr;
	}

	engine_ = std::shared_ptr<EngineHandle>(std::move(engine));
	engine_model_ = model_name;
	return engine_;
}

void BackendSelector::ResetBackendDetection() {
	std::lock_guard<std::mutex> lock(mutex_);
	detected_ = false;
	backend_ = BackendDescriptor();
	engine_.reset();
	engine_model_.clear();
}

BackendStatus BackendSelector::Status(const std::string &model_name, const std::string &model_dir) {
	std::lock_guard<std::mutex> lock(mutex_);
	BackendStatus status;
	status.backend = DetectLocked();
	status.preference = BackendPreferenceToString(preference_);
	status.model = model_name;
	status.model_path = ModelManager::GetModelPath(model_name, model_dir);
	status.model_present = ModelManager::IsModelDownloaded(model_name, model_dir);
	status.engine_loaded = engine_ != nullptr && engine_model_ == model_name;
	status.platform = platform_.ToString();
	return status;
}

} // namespace readalong
