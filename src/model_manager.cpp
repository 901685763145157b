#include "model_manager.hpp"
#include "http_client.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <unordered_map>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace readalong {

// Available Whisper models
static const std::vector<std::string> AVAILABLE_MODELS = {
    "tiny",
    "tiny.en",
    "base",
    "base.en",
    "small",
    "small.en",
    "medium",
    "medium.en",
    "large-v1",
    "large-v2",
    "large-v3",
    "large-v3-turbo"
};

// Model descriptions
static const std::unordered_map<std::string, std::string> MODEL_DESCRIPTIONS = {
    {"tiny", "Tiny multilingual model (~75MB, fastest)"},
    {"tiny.en", "Tiny English-only model (~75MB, fastest)"},
    {"base", "Base multilingual model (~142MB)"},
    {"base.en", "Base English-only model (~142MB)"},
    {"small", "Small multilingual model (~466MB)"},
    {"small.en", "Small English-only model (~466MB)"},
    {"medium", "Medium multilingual model (~1.5GB)"},
    {"medium.en", "Medium English-only model (~1.5GB)"},
    {"large-v1", "Large multilingual model v1 (~2.9GB)"},
    {"large-v2", "Large multilingual model v2 (~2.9GB)"},
    {"large-v3", "Large multilingual model v3 (~2.9GB, most accurate)"},
    {"large-v3-turbo", "Large multilingual model v3 turbo (~1.6GB, fast + accurate)"}
};

std::string ModelManager::GetModelUrl(const std::string &model_name, const std::string &base_url) {
	std::string url = base_url;
	if (!url.empty() && url.back() != '/') {
		url += '/';
	}
	return url + GetModelFileName(model_name);
}

std::string ModelManager::GetModelFileName(const std::string &model_name) {
	return "ggml-" + model_name + ".bin";
}

std::string ModelManager::GetModelPath(const std::string &model_name, const std::string &base_path) {
	return base_path + "/" + GetModelFileName(model_name);
}

bool ModelManager::IsModelDownloaded(const std::string &model_name, const std::string &base_path) {
	std::string path = GetModelPath(model_name, base_path);
	struct stat buffer;
	return (stat(path.c_str(), &buffer) == 0);
}

ModelInfo ModelManager::GetModelInfo(const std::string &model_name, const std::string &base_path) {
	ModelInfo info;
	info.name = model_name;
	info.file_path = GetModelPath(model_name, base_path);
	info.is_downloaded = IsModelDownloaded(model_name, base_path);
	info.file_size = 0;

	auto desc_it = MODEL_DESCRIPTIONS.find(model_name);
	info.description = desc_it != MODEL_DESCRIPTIONS.end() ? desc_it->second : "";

	if (info.is_downloaded) {
		struct stat buffer;
		if (stat(info.file_path.c_str(), &buffer) == 0) {
			info.file_size = buffer.st_size;
		}
	}

	return info;
}

std::vector<ModelInfo> ModelManager::ListModels(const std::string &base_path) {
	std::vector<ModelInfo> models;
	for (const auto &model_name : AVAILABLE_MODELS) {
		models.push_back(GetModelInfo(model_name, base_path));
	}
	return models;
}

// Helper to create directories recursively
static bool CreateDirectories(const std::string &path) {
	std::string current;
	for (size_t i = 0; i < path.size(); i++) {
		current += path[i];
		if (path[i] == '/' || path[i] == '\\' || i == path.size() - 1) {
			struct stat buffer;
			if (stat(current.c_str(), &buffer) != 0) {
#ifdef _WIN32
				if (_mkdir(current.c_str()) != 0 && errno != EEXIST) {
					return false;
				}
#else
				if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
					return false;
				}
#endif
			}
		}
	}
	return true;
}

bool ModelManager::DownloadModel(const std::string &model_name, const std::string &base_path,
                                 const std::string &base_url, std::string &error) {
	if (!IsValidModelName(model_name)) {
		error = "Invalid model name: " + model_name;
		return false;
	}

	// Create directory if it doesn't exist
	if (!CreateDirectories(base_path)) {
		error = "Failed to create model directory: " + base_path;
		return false;
	}

	// One download at a time in this process; a second caller finds the finished file
	static std::mutex download_mutex;
	std::lock_guard<std::mutex> lock(download_mutex);
	if (IsModelDownloaded(model_name, base_path)) {
		return true;
	}

	std::string model_url = GetModelUrl(model_name, base_url);
	std::string model_path = GetModelPath(model_name, base_path);
	// Unique per download so other processes never write the same partial file
	static std::atomic<uint64_t> download_counter(0);
	std::string tmp_path = model_path + ".tmp." + std::to_string(static_cast<long long>(getpid())) + "." +
	                       std::to_string(++download_counter);

	HttpClient client;
	HttpResponse response = client.Download(model_url, tmp_path);
	if (response.success && response.bytes_written == 0) {
		response.success = false;
		response.error = "Downloaded model file is empty";
	}
	if (!response.success) {
		std::remove(tmp_path.c_str());
		error = "Failed to download model " + model_name + " from " + model_url + ": " + response.error;
		return false;
	}

	if (std::rename(tmp_path.c_str(), model_path.c_str()) != 0) {
		std::remove(tmp_path.c_str());
		error = "Failed to move downloaded model into place: " + model_path;
		return false;
	}

	return true;
}

bool ModelManager::EnsureModel(const std::string &model_name, const std::string &base_path,
                               const std::string &base_url, std::string &model_path, std::string &error) {
	if (!IsValidModelName(model_name)) {
		error = "Invalid model name: " + model_name;
		return false;
	}
	model_path = GetModelPath(model_name, base_path);
	if (IsModelDownloaded(model_name, base_path)) {
		return true;
	}
	return DownloadModel(model_name, base_path, base_url, error);
}

bool ModelManager::IsValidModelName(const std::string &model_name) {
	for (const auto &valid_name : AVAILABLE_MODELS) {
		if (valid_name == model_name) {
			return true;
		}
	}
	return false;
}

} // namespace readalong
