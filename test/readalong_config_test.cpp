#include "readalong_config.hpp"

#include "gtest/gtest.h"

#include <limits>

namespace readalong {

TEST(ReadalongConfigTest, DefaultsAreValid) {
	ReadalongConfig config;
	std::string error;
	EXPECT_TRUE(config.Validate(error)) << error;
}

TEST(ReadalongConfigTest, BoundariesAreAccepted) {
	ReadalongConfig config;
	config.match_threshold = 0.0;
	config.synthetic_confidence = 1.0;
	config.interpolated_confidence = 1.0;
	config.synthetic_sentence_seconds = 0.5;
	config.min_document_chars = 0;
	std::string error;
	EXPECT_TRUE(config.Validate(error)) << error;
}

TEST(ReadalongConfigTest, ConfidencesOutsideUnitIntervalAreRejected) {
	std::string error;

	ReadalongConfig threshold;
	threshold.match_threshold = 1.5;
	EXPECT_FALSE(threshold.Validate(error));
	EXPECT_NE(error.find("readalong_match_threshold"), std::string::npos);

	ReadalongConfig synthetic;
	synthetic.synthetic_confidence = -0.1;
	EXPECT_FALSE(synthetic.Validate(error));
	EXPECT_NE(error.find("readalong_synthetic_confidence"), std::string::npos);

	ReadalongConfig interpolated;
	interpolated.interpolated_confidence = std::numeric_limits<double>::quiet_NaN();
	EXPECT_FALSE(interpolated.Validate(error));
	EXPECT_NE(error.find("readalong_interpolated_confidence"), std::string::npos);
}

TEST(ReadalongConfigTest, PlaceholderSentencesNeedAPositiveLength) {
	std::string error;
	for (double seconds : {0.0, -3.0, 0.01, 1e9}) {
		ReadalongConfig config;
		config.synthetic_sentence_seconds = seconds;
		EXPECT_FALSE(config.Validate(error)) << seconds;
		EXPECT_NE(error.find("readalong_synthetic_sentence_seconds"), std::string::npos);
	}
}

TEST(ReadalongConfigTest, NegativeCountsAreRejected) {
	std::string error;

	ReadalongConfig threads;
	threads.threads = -2;
	EXPECT_FALSE(threads.Validate(error));
	EXPECT_NE(error.find("readalong_threads"), std::string::npos);

	ReadalongConfig chars;
	chars.min_document_chars = -1;
	EXPECT_FALSE(chars.Validate(error));
	EXPECT_NE(error.find("readalong_min_document_chars"), std::string::npos);
}

} // namespace readalong
