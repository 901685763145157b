#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace readalong {

struct ModelInfo {
	std::string name;        // Model name (e.g., "base.en")
	std::string file_path;   // Full path to model file
	int64_t file_size;       // File size in bytes
	bool is_downloaded;      // Whether the model exists locally
	std::string description; // Model description
};

class ModelManager {
public:
	// Get download URL for model under the given registry base URL
	static std::string GetModelUrl(const std::string &model_name, const std::string &base_url);

	// Get model file name
	static std::string GetModelFileName(const std::string &model_name);

	// Get full path to model file
	static std::string GetModelPath(const std::string &model_name, const std::string &base_path);

	// Check if model exists locally
	static bool IsModelDownloaded(const std::string &model_name, const std::string &base_path);

	// Get info for a specific model
	static ModelInfo GetModelInfo(const std::string &model_name, const std::string &base_path);

	// List all models with download status
	static std::vector<ModelInfo> ListModels(const std::string &base_path);

	// Download model into base_path. Writes to a temporary file unique to this download
	// and renames it once complete; on failure nothing is left behind.
	static bool DownloadModel(const std::string &model_name, const std::string &base_path,
	                          const std::string &base_url, std::string &error);

	// Resolve the local model file, downloading it first when absent
	static bool EnsureModel(const std::string &model_name, const std::string &base_path, const std::string &base_url,
	                        std::string &model_path, std::string &error);

	// Validate model name
	static bool IsValidModelName(const std::string &model_name);
};

} // namespace readalong
