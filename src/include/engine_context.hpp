#pragma once

#include "readalong_types.hpp"
#include <string>
#include <vector>

namespace readalong {

struct EngineOptions {
	std::string language; // ISO code or "auto"
	int threads;          // 0 = auto

	EngineOptions() : language("auto"), threads(0) {
	}
};

// A loaded recognition model bound to one compute backend
class EngineHandle {
public:
	virtual ~EngineHandle() {
	}

	// Decode audio_path and return chapter-relative fragments in order
	virtual bool TranscribeFile(const std::string &audio_path, const EngineOptions &options,
	                            std::vector<TimedFragment> &fragments, std::string &error) = 0;
};

} // namespace readalong
