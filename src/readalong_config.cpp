#include "readalong_config.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/database.hpp"
#include "duckdb/main/config.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace readalong {

using duckdb::LogicalType;
using duckdb::Value;

ReadalongConfig::ReadalongConfig()
    : model(DEFAULT_MODEL), model_path(GetDefaultModelPath()), model_base_url(DEFAULT_MODEL_BASE_URL),
      language(DEFAULT_LANGUAGE), threads(DEFAULT_THREADS), backend(DEFAULT_BACKEND),
      match_threshold(DEFAULT_MATCH_THRESHOLD), synthetic_confidence(DEFAULT_SYNTHETIC_CONFIDENCE),
      interpolated_confidence(DEFAULT_INTERPOLATED_CONFIDENCE),
      synthetic_sentence_seconds(DEFAULT_SYNTHETIC_SENTENCE_SECONDS), min_document_chars(DEFAULT_MIN_DOCUMENT_CHARS),
      verbose(DEFAULT_VERBOSE), ffmpeg_logging(DEFAULT_FFMPEG_LOGGING) {
}

std::string ReadalongConfig::GetDefaultModelPath() {
	std::string home_dir;

#ifdef _WIN32
	char path[MAX_PATH];
	if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
		home_dir = path;
	} else {
		home_dir = std::getenv("USERPROFILE") ? std::getenv("USERPROFILE") : "C:\\";
	}
	return home_dir + "\\.duckdb\\readalong\\models";
#else
	const char *home = std::getenv("HOME");
	if (!home) {
		struct passwd *pw = getpwuid(getuid());
		home = pw ? pw->pw_dir : "/tmp";
	}
	home_dir = home;
	return home_dir + "/.duckdb/readalong/models";
#endif
}

static bool CheckUnitInterval(const char *name, double value, std::string &error) {
	if (!(value >= 0.0 && value <= 1.0)) {
		error = std::string("Invalid ") + name + " " + std::to_string(value) + ". Use a value between 0 and 1.";
		return false;
	}
	return true;
}

bool ReadalongConfig::Validate(std::string &error) const {
	if (!CheckUnitInterval("readalong_match_threshold", match_threshold, error) ||
	    !CheckUnitInterval("readalong_synthetic_confidence", synthetic_confidence, error) ||
	    !CheckUnitInterval("readalong_interpolated_confidence", interpolated_confidence, error)) {
		return false;
	}
	if (!(synthetic_sentence_seconds >= MIN_SYNTHETIC_SENTENCE_SECONDS && synthetic_sentence_seconds <= 3600.0)) {
		error = "Invalid readalong_synthetic_sentence_seconds " + std::to_string(synthetic_sentence_seconds) +
		        ". Use a value between 0.5 and 3600.";
		return false;
	}
	if (threads < 0) {
		error = "Invalid readalong_threads " + std::to_string(threads) + ". Use 0 for automatic or a positive count.";
		return false;
	}
	if (min_document_chars < 0) {
		error = "Invalid readalong_min_document_chars " + std::to_string(min_document_chars) + ". Use 0 or more.";
		return false;
	}
	return true;
}

void LogStatus(const ReadalongConfig &config, const std::string &message) {
	if (config.verbose) {
		duckdb::Printer::Print(duckdb::OutputStream::STREAM_STDERR, "[readalong] " + message);
	}
}

void LogError(const std::string &message) {
	duckdb::Printer::Print(duckdb::OutputStream::STREAM_STDERR, "[readalong] error: " + message);
}

void ReadalongConfigManager::RegisterSettings(duckdb::DatabaseInstance &db, const std::string &backend_default) {
	auto &config = duckdb::DBConfig::GetConfig(db);

	// Model settings
	config.AddExtensionOption("readalong_model", "Whisper model name (e.g., tiny.en, base.en, small, medium, large-v3)",
	                          LogicalType::VARCHAR, Value(ReadalongConfig::DEFAULT_MODEL));

	config.AddExtensionOption("readalong_model_path", "Directory to store Whisper models", LogicalType::VARCHAR,
	                          Value(ReadalongConfig::GetDefaultModelPath()));

	config.AddExtensionOption("readalong_model_base_url", "Base URL models are downloaded from",
	                          LogicalType::VARCHAR, Value(ReadalongConfig::DEFAULT_MODEL_BASE_URL));

	config.AddExtensionOption("readalong_language", "Target language code or 'auto' for detection",
	                          LogicalType::VARCHAR, Value(ReadalongConfig::DEFAULT_LANGUAGE));

	config.AddExtensionOption("readalong_threads", "Number of processing threads (0 = auto-detect)",
	                          LogicalType::INTEGER, Value::INTEGER(ReadalongConfig::DEFAULT_THREADS));

	config.AddExtensionOption("readalong_backend", "Compute backend: auto, metal, cuda, vulkan or cpu",
	                          LogicalType::VARCHAR, Value(backend_default));

	// Alignment settings
	config.AddExtensionOption("readalong_match_threshold", "Minimum similarity for a sentence match (0-1)",
	                          LogicalType::DOUBLE, Value::DOUBLE(ReadalongConfig::DEFAULT_MATCH_THRESHOLD));

	config.AddExtensionOption("readalong_synthetic_confidence", "Confidence assigned to time-based alignments",
	                          LogicalType::DOUBLE, Value::DOUBLE(ReadalongConfig::DEFAULT_SYNTHETIC_CONFIDENCE));

	config.AddExtensionOption("readalong_interpolated_confidence", "Confidence assigned to interpolated sentences",
	                          LogicalType::DOUBLE, Value::DOUBLE(ReadalongConfig::DEFAULT_INTERPOLATED_CONFIDENCE));

	config.AddExtensionOption("readalong_synthetic_sentence_seconds",
	                          "Length of placeholder sentences when transcription is unavailable",
	                          LogicalType::DOUBLE, Value::DOUBLE(ReadalongConfig::DEFAULT_SYNTHETIC_SENTENCE_SECONDS));

	config.AddExtensionOption("readalong_min_document_chars",
	                          "Minimum extracted characters before a document counts as text-bearing",
	                          LogicalType::INTEGER, Value::INTEGER(ReadalongConfig::DEFAULT_MIN_DOCUMENT_CHARS));

	// Logging
	config.AddExtensionOption("readalong_verbose", "Show status messages while jobs run", LogicalType::BOOLEAN,
	                          Value::BOOLEAN(ReadalongConfig::DEFAULT_VERBOSE));

	config.AddExtensionOption("readalong_ffmpeg_logging", "Enable FFmpeg log output (warnings, info messages)",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(ReadalongConfig::DEFAULT_FFMPEG_LOGGING));
}

ReadalongConfig ReadalongConfigManager::GetConfig(duckdb::ClientContext &context) {
	ReadalongConfig config;
	Value val;

	if (context.TryGetCurrentSetting("readalong_model", val)) {
		config.model = val.GetValue<std::string>();
	}
	if (context.TryGetCurrentSetting("readalong_model_path", val)) {
		config.model_path = val.GetValue<std::string>();
	}
	if (context.TryGetCurrentSetting("readalong_model_base_url", val)) {
		config.model_base_url = val.GetValue<std::string>();
	}
	if (context.TryGetCurrentSetting("readalong_language", val)) {
		config.language = val.GetValue<std::string>();
	}
	if (context.TryGetCurrentSetting("readalong_threads", val)) {
		config.threads = val.GetValue<int32_t>();
	}
	if (context.TryGetCurrentSetting("readalong_backend", val)) {
		config.backend = val.GetValue<std::string>();
	}
	if (context.TryGetCurrentSetting("readalong_match_threshold", val)) {
		config.match_threshold = val.GetValue<double>();
	}
	if (context.TryGetCurrentSetting("readalong_synthetic_confidence", val)) {
		config.synthetic_confidence = val.GetValue<double>();
	}
	if (context.TryGetCurrentSetting("readalong_interpolated_confidence", val)) {
		config.interpolated_confidence = val.GetValue<double>();
	}
	if (context.TryGetCurrentSetting("readalong_synthetic_sentence_seconds", val)) {
		config.synthetic_sentence_seconds = val.GetValue<double>();
	}
	if (context.TryGetCurrentSetting("readalong_min_document_chars", val)) {
		config.min_document_chars = val.GetValue<int32_t>();
	}
	if (context.TryGetCurrentSetting("readalong_verbose", val)) {
		config.verbose = val.GetValue<bool>();
	}
	if (context.TryGetCurrentSetting("readalong_ffmpeg_logging", val)) {
		config.ffmpeg_logging = val.GetValue<bool>();
	}

	return config;
}

} // namespace readalong
