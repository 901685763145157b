#pragma once

#include "duckdb.hpp"
#include "duckdb/main/database.hpp"
#include <string>

namespace readalong {

struct ReadalongConfig {
	// Model settings
	std::string model;          // Model name (e.g., "base.en", "small", "medium")
	std::string model_path;     // Directory holding ggml-<model>.bin files
	std::string model_base_url; // Registry the models are downloaded from
	std::string language;       // Language code or "auto"

	// Processing settings
	int threads;         // Number of threads to use (0 = auto)
	std::string backend; // auto, metal, cuda, vulkan, cpu

	// Alignment settings
	double match_threshold;            // Minimum Jaro-Winkler similarity for a match
	double synthetic_confidence;       // Confidence of time-based records
	double interpolated_confidence;    // Confidence of interpolated records
	double synthetic_sentence_seconds; // Length of placeholder sentences
	int min_document_chars;            // Below this a document is treated as scanned

	// Logging
	bool verbose;
	bool ffmpeg_logging;

	// Default values
	static constexpr const char *DEFAULT_MODEL = "base.en";
	static constexpr const char *DEFAULT_MODEL_BASE_URL = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";
	static constexpr const char *DEFAULT_LANGUAGE = "auto";
	static constexpr int DEFAULT_THREADS = 0;
	static constexpr const char *DEFAULT_BACKEND = "auto";
	static constexpr double DEFAULT_MATCH_THRESHOLD = 0.7;
	static constexpr double DEFAULT_SYNTHETIC_CONFIDENCE = 0.3;
	static constexpr double DEFAULT_INTERPOLATED_CONFIDENCE = 0.5;
	static constexpr double DEFAULT_SYNTHETIC_SENTENCE_SECONDS = 3.0;
	static constexpr int DEFAULT_MIN_DOCUMENT_CHARS = 100;
	static constexpr bool DEFAULT_VERBOSE = false;
	static constexpr bool DEFAULT_FFMPEG_LOGGING = false;

	// Shortest placeholder sentence accepted from readalong_synthetic_sentence_seconds
	static constexpr double MIN_SYNTHETIC_SENTENCE_SECONDS = 0.5;

	ReadalongConfig();

	// Check that numeric settings are in range; error names the offending setting
	bool Validate(std::string &error) const;

	// Get default model path based on platform
	static std::string GetDefaultModelPath();
};

// Writes a status line to stderr when verbose mode is on
void LogStatus(const ReadalongConfig &config, const std::string &message);

// Writes an error line to stderr regardless of verbosity
void LogError(const std::string &message);

class ReadalongConfigManager {
public:
	// Register DuckDB extension settings via AddExtensionOption.
	// backend_default is the persisted backend preference.
	static void RegisterSettings(duckdb::DatabaseInstance &db, const std::string &backend_default);

	// Get current configuration from context (reads from DuckDB settings)
	static ReadalongConfig GetConfig(duckdb::ClientContext &context);
};

} // namespace readalong
