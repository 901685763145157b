#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace readalong {

struct AudioMetadata {
	double duration_seconds;
	int sample_rate;
	int channels;
	std::string format;
	int64_t file_size;
};

class AudioUtils {
public:
	// Decode a file and convert to 16kHz mono float32 PCM (whisper requirement)
	static bool LoadAudioFile(const std::string &file_path, std::vector<float> &output, std::string &error);

	// Probe container metadata without decoding
	static bool GetAudioMetadata(const std::string &file_path, AudioMetadata &metadata, std::string &error);

	// Probe only the duration, in seconds
	static bool ProbeDuration(const std::string &file_path, double &duration_seconds, std::string &error);

	// Configure FFmpeg logging (true = AV_LOG_INFO, false = AV_LOG_QUIET)
	static void SetFFmpegLogging(bool enabled);

	static constexpr int WHISPER_SAMPLE_RATE = 16000;
};

} // namespace readalong
