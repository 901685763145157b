#pragma once

#include "engine_context.hpp"
#include "whisper.h"
#include <memory>
#include <mutex>
#include <string>

namespace readalong {

// RAII wrapper for whisper_context
class WhisperContextWrapper : public EngineHandle {
public:
    explicit WhisperContextWrapper(whisper_context *ctx);
    ~WhisperContextWrapper() override;

    // Non-copyable
    WhisperContextWrapper(const WhisperContextWrapper &) = delete;
    WhisperContextWrapper &operator=(const WhisperContextWrapper &) = delete;

    whisper_context *Get() const { return ctx_; }
    bool IsValid() const { return ctx_ != nullptr; }

    bool TranscribeFile(const std::string &audio_path, const EngineOptions &options,
                        std::vector<TimedFragment> &fragments, std::string &error) override;

    // Load a model; returns nullptr with error set when the backend cannot initialize it
    static std::unique_ptr<EngineHandle> Create(const std::string &model_path, bool use_gpu, std::string &error);

    // Route whisper.cpp/ggml logging to stderr (verbose) or drop it
    static void ConfigureLogging(bool verbose);

private:
    whisper_context *ctx_;
    std::mutex mutex_; // whisper_full is not reentrant on one context
};

} // namespace readalong
