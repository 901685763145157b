#include "whisper_context.hpp"
#include "audio_utils.hpp"
#include "duckdb/common/printer.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace readalong {

static std::atomic<bool> g_whisper_verbose(false);

static void WhisperLogCallback(enum ggml_log_level level, const char *text, void *user_data) {
	(void)user_data;
	if (!g_whisper_verbose.load() || !text) {
		return;
	}
	if (level == GGML_LOG_LEVEL_DEBUG) {
		return;
	}
	std::string line(text);
	while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
		line.pop_back();
	}
	if (!line.empty()) {
		duckdb::Printer::Print(duckdb::OutputStream::STREAM_STDERR, "[whisper] " + line);
	}
}

void WhisperContextWrapper::ConfigureLogging(bool verbose) {
	g_whisper_verbose = verbose;
	whisper_log_set(WhisperLogCallback, nullptr);
}

WhisperContextWrapper::WhisperContextWrapper(whisper_context *ctx) : ctx_(ctx) {
}

WhisperContextWrapper::~WhisperContextWrapper() {
	if (ctx_) {
		whisper_free(ctx_);
		ctx_ = nullptr;
	}
}

std::unique_ptr<EngineHandle> WhisperContextWrapper::Create(const std::string &model_path, bool use_gpu,
                                                            std::string &error) {
	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = use_gpu;

	whisper_context *ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
	if (!ctx) {
		error = std::string("Failed to load whisper model on ") + (use_gpu ? "GPU" : "CPU") + " from: " + model_path;
		return nullptr;
	}
	return std::unique_ptr<EngineHandle>(new WhisperContextWrapper(ctx));
}

bool WhisperContextWrapper::TranscribeFile(const std::string &audio_path, const EngineOptions &options,
                                           std::vector<TimedFragment> &fragments, std::string &error) {
	std::vector<float> pcm_data;
	std::string load_error;
	if (!AudioUtils::LoadAudioFile(audio_path, pcm_data, load_error)) {
		error = "Failed to load audio: " + load_error;
		return false;
	}
	if (pcm_data.empty()) {
		error = "Empty audio data";
		return false;
	}

	std::lock_guard<std::mutex> lock(mutex_);

	whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

	// Set language
	if (options.language != "auto") {
		wparams.language = options.language.c_str();
	} else {
		wparams.language = nullptr; // Auto-detect
	}

	// Set thread count
	if (options.threads > 0) {
		wparams.n_threads = options.threads;
	} else {
		wparams.n_threads = std::min(8, std::max(1, static_cast<int>(std::thread::hardware_concurrency())));
	}

	wparams.print_progress = false;
	wparams.print_special = false;
	wparams.print_realtime = false;
	wparams.print_timestamps = false;
	wparams.translate = false;
	wparams.single_segment = false;

	int ret = whisper_full(ctx_, wparams, pcm_data.data(), static_cast<int>(pcm_data.size()));
	if (ret != 0) {
		error = "Transcription failed with error code: " + std::to_string(ret);
		return false;
	}

	// Segment timestamps are in centiseconds
	int n_segments = whisper_full_n_segments(ctx_);
	fragments.clear();
	fragments.reserve(n_segments);
	for (int i = 0; i < n_segments; i++) {
		TimedFragment fragment;
		const char *text = whisper_full_get_segment_text(ctx_, i);
		fragment.text = text ? text : "";
		fragment.start_ms = whisper_full_get_segment_t0(ctx_, i) * 10;
		fragment.end_ms = whisper_full_get_segment_t1(ctx_, i) * 10;
		fragments.push_back(fragment);
	}

	return true;
}

} // namespace readalong
