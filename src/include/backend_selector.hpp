#pragma once

#include "engine_context.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace readalong {

enum class BackendPreference : uint8_t { AUTO, METAL, CUDA, VULKAN, CPU };

std::string BackendPreferenceToString(BackendPreference preference);
bool BackendPreferenceFromString(const std::string &str, BackendPreference &preference);

struct BackendDescriptor {
	std::string name;    // metal, cuda, vulkan, cpu
	bool gpu;
	std::string variant; // build variant suffix, empty for the default build
	std::string reason;  // why this backend was chosen

	BackendDescriptor() : gpu(false) {
	}
};

struct PlatformInfo {
	std::string os;   // darwin, linux, win32, unknown
	std::string arch; // arm64, x64, unknown

	static PlatformInfo Current();
	std::string ToString() const;
};

class BackendProbe {
public:
	virtual ~BackendProbe() {
	}
	virtual std::string Name() const = 0;
	virtual bool IsAvailable() const = 0;
};

// Apple Silicon is the only Metal target
class MetalProbe : public BackendProbe {
public:
	explicit MetalProbe(PlatformInfo platform);
	std::string Name() const override;
	bool IsAvailable() const override;

private:
	PlatformInfo platform_;
};

// Asks the ggml backend registry for a backend with at least one device
class GgmlRegistryProbe : public BackendProbe {
public:
	GgmlRegistryProbe(std::string name, std::string registry_name);
	std::string Name() const override;
	bool IsAvailable() const override;

private:
	std::string name_;
	std::string registry_name_;
};

class CpuProbe : public BackendProbe {
public:
	std::string Name() const override;
	bool IsAvailable() const override;
};

// Metal, CUDA, Vulkan and CPU probes for the given platform
std::vector<std::shared_ptr<BackendProbe>> DefaultBackendProbes(const PlatformInfo &platform);

// Builds an engine for model_path on the given backend, nullptr with error on failure
typedef std::function<std::unique_ptr<EngineHandle>(const std::string &model_path, const BackendDescriptor &backend,
                                                    std::string &error)>
    EngineFactory;

// Resolves a model name to a local file, downloading when needed
typedef std::function<bool(const std::string &model_name, std::string &model_path, std::string &error)> ModelResolver;

struct BackendStatus {
	BackendDescriptor backend;
	std::string preference;
	std::string model;
	std::string model_path;
	bool model_present;
	bool engine_loaded;
	std::string platform;
};

class BackendSelector {
public:
	BackendSelector(PlatformInfo platform, std::vector<std::shared_ptr<BackendProbe>> probes, EngineFactory factory,
	                ModelResolver resolver);

	// Engine factory backed by whisper.cpp
	static EngineFactory WhisperEngineFactory();

	// Changing the preference resets detection
	void SetPreference(BackendPreference preference);
	BackendPreference GetPreference() const;

	// Memoized backend choice
	BackendDescriptor Detect();

	// Local path of the model artifact, downloading it if absent
	bool EnsureModel(const std::string &model_name, std::string &model_path, std::string &error);

	// Shared engine for model_name; rebuilt only when the model changes. A GPU failure
	// falls back once to CPU, which then sticks until ResetBackendDetection.
	std::shared_ptr<EngineHandle> GetEngineContext(const std::string &model_name, std::string &error);

	// Forget the detected backend and release the engine
	void ResetBackendDetection();

	BackendStatus Status(const std::string &model_name, const std::string &model_dir);

private:
	BackendDescriptor DetectLocked();
	BackendDescriptor AutoDetect() const;
	bool ProbeAvailable(const std::string &name) const;

	PlatformInfo platform_;
	std::vector<std::shared_ptr<BackendProbe>> probes_;
	EngineFactory factory_;
	ModelResolver resolver_;

	mutable std::mutex mutex_;
	BackendPreference preference_;
	bool detected_;
	BackendDescriptor backend_;
	std::shared_ptr<EngineHandle> engine_;
	std::string engine_model_;
};

} // namespace readalong
