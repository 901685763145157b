#include "alignment_json.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace readalong {

std::string EscapeJsonString(const std::string &str) {
	std::ostringstream escaped;
	for (char c : str) {
		switch (c) {
		case '"':
			escaped << "\\\"";
			break;
		case '\\':
			escaped << "\\\\";
			break;
		case '\b':
			escaped << "\\b";
			break;
		case '\f':
			escaped << "\\f";
			break;
		case '\n':
			escaped << "\\n";
			break;
		case '\r':
			escaped << "\\r";
			break;
		case '\t':
			escaped << "\\t";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				char buffer[8];
				snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
				escaped << buffer;
			} else {
				escaped << c;
			}
		}
	}
	return escaped.str();
}

// Millisecond precision without trailing zeros
static std::string FormatNumber(double value) {
	if (!std::isfinite(value)) {
		return "0";
	}
	char buffer[64];
	snprintf(buffer, sizeof(buffer), "%.3f", value);
	std::string text(buffer);
	size_t dot = text.find('.');
	if (dot != std::string::npos) {
		size_t last = text.find_last_not_of('0');
		text.erase(last == dot ? dot : last + 1);
	}
	if (text == "-0") {
		text = "0";
	}
	return text;
}

static void RenderRecord(std::ostringstream &json, const AlignmentRecord &record) {
	json << "{\"id\":\"" << EscapeJsonString(record.id) << "\",\"text\":\"" << EscapeJsonString(record.text) << "\"";
	json << ",\"position\":{\"x\":" << FormatNumber(record.position.x) << ",\"y\":" << FormatNumber(record.position.y)
	     << ",\"width\":" << FormatNumber(record.position.width)
	     << ",\"height\":" << FormatNumber(record.position.height) << "}";
	json << ",\"audio\":";
	if (record.has_audio) {
		json << "{\"chapterIndex\":" << record.audio.chapter_index
		     << ",\"globalStart\":" << FormatNumber(record.audio.global_start)
		     << ",\"globalEnd\":" << FormatNumber(record.audio.global_end);
		if (record.interpolated) {
			json << ",\"interpolated\":true";
		}
		json << "}";
	} else {
		json << "null";
	}
	json << ",\"confidence\":" << FormatNumber(record.confidence) << "}";
}

std::string RenderAlignmentJson(const AlignmentResult &alignment) {
	std::ostringstream json;
	json << "{\"documentId\":" << alignment.document_id << ",\"pages\":[";
	for (size_t p = 0; p < alignment.pages.size(); p++) {
		const auto &page = alignment.pages[p];
		if (p > 0) {
			json << ",";
		}
		json << "{\"pageNumber\":" << page.page_number << ",\"sentences\":[";
		for (size_t s = 0; s < page.sentences.size(); s++) {
			if (s > 0) {
				json << ",";
			}
			RenderRecord(json, page.sentences[s]);
		}
		json << "]}";
	}
	json << "],\"metadata\":{\"documentSentenceCount\":" << alignment.total_count
	     << ",\"audioSentenceCount\":" << alignment.audio_sentence_count
	     << ",\"matchedCount\":" << alignment.matched_count
	     << ",\"interpolatedCount\":" << alignment.interpolated_count
	     << ",\"totalCount\":" << alignment.total_count
	     << ",\"averageConfidence\":" << FormatNumber(alignment.average_confidence);
	if (!alignment.alignment_type.empty()) {
		json << ",\"alignmentType\":\"" << EscapeJsonString(alignment.alignment_type) << "\"";
	}
	json << "},\"quality\":" << alignment.quality << "}";
	return json.str();
}

} // namespace readalong
