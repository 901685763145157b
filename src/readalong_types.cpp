#include "readalong_types.hpp"

namespace readalong {

std::string JobKindToString(JobKind kind) {
	switch (kind) {
	case JobKind::BOOK:
		return "book";
	case JobKind::DOCUMENT:
		return "document";
	}
	return "book";
}

bool JobKindFromString(const std::string &str, JobKind &kind) {
	if (str == "book") {
		kind = JobKind::BOOK;
		return true;
	}
	if (str == "document") {
		kind = JobKind::DOCUMENT;
		return true;
	}
	return false;
}

std::string JobStatusToString(JobStatus status) {
	switch (status) {
	case JobStatus::PENDING:
		return "pending";
	case JobStatus::EXTRACTING:
		return "extracting";
	case JobStatus::TRANSCRIBING:
		return "transcribing";
	case JobStatus::ALIGNING:
		return "aligning";
	case JobStatus::COMPLETED:
		return "completed";
	case JobStatus::FAILED:
		return "failed";
	case JobStatus::CANCELLED:
		return "cancelled";
	}
	return "pending";
}

bool JobStatusFromString(const std::string &str, JobStatus &status) {
	static const JobStatus ALL[] = {JobStatus::PENDING,   JobStatus::EXTRACTING, JobStatus::TRANSCRIBING,
	                                JobStatus::ALIGNING,  JobStatus::COMPLETED,  JobStatus::FAILED,
	                                JobStatus::CANCELLED};
	for (auto candidate : ALL) {
		if (JobStatusToString(candidate) == str) {
			status = candidate;
			return true;
		}
	}
	return false;
}

bool IsTerminalStatus(JobStatus status) {
	return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}

int32_t BookTranscript::ChapterAt(double global_time) const {
	if (chapter_indices.empty()) {
		return 0;
	}
	int32_t chapter = chapter_indices[0];
	for (size_t i = 0; i < chapter_offsets.size(); i++) {
		if (global_time >= chapter_offsets[i]) {
			chapter = chapter_indices[i];
		} else {
			break;
		}
	}
	return chapter;
}

size_t ExtractedDocument::SentenceCount() const {
	size_t count = 0;
	for (const auto &page : pages) {
		count += page.sentences.size();
	}
	return count;
}

} // namespace readalong
