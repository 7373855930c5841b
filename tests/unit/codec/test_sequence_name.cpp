/**
 * @file test_sequence_name.cpp
 * @brief Unit tests for sequence name splitting and joining
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/codec/sequence_name.h>

namespace edgefirst::sync::test {

class SequenceNameTest : public ::testing::Test {
protected:
    sequence_resolver plain_;
    sequence_resolver detecting_{sequence_options{true}};
};

TEST_F(SequenceNameTest, StemRemovesDirectoryExtensionAndSensor) {
    EXPECT_EQ(plain_.stem("a/b/deer_003.camera.jpeg"), "deer_003");
    EXPECT_EQ(plain_.stem("C:\\data\\img.png"), "img");
    EXPECT_EQ(plain_.stem("noext"), "noext");
}

TEST_F(SequenceNameTest, DetectionOffByDefault) {
    auto split = plain_.split("deer_003.camera.jpeg");

    EXPECT_EQ(split.name, "deer_003");
    EXPECT_FALSE(split.frame.has_value());
}

TEST_F(SequenceNameTest, KnownSequenceMatchedWithoutDetection) {
    auto split = plain_.split("deer_003.camera.jpeg", std::string("deer"));

    EXPECT_EQ(split, (split_name{"deer", 3u}));
}

TEST_F(SequenceNameTest, KnownSequenceWithUnderscores) {
    auto split = detecting_.split("my_drive_2_017.camera.jpeg", std::string("my_drive_2"));

    EXPECT_EQ(split, (split_name{"my_drive_2", 17u}));
}

TEST_F(SequenceNameTest, KnownSequenceMismatchFallsBack) {
    auto split = plain_.split("fox_010.camera.jpeg", std::string("deer"));

    EXPECT_EQ(split.name, "fox_010");
    EXPECT_FALSE(split.frame.has_value());
}

TEST_F(SequenceNameTest, DetectionSplitsTrailingDigits) {
    EXPECT_EQ(detecting_.split("deer_003.camera.jpeg"), (split_name{"deer", 3u}));
    EXPECT_EQ(detecting_.split("run_a_12.jpg"), (split_name{"run_a", 12u}));
}

TEST_F(SequenceNameTest, DetectionIgnoresNonNumericSuffix) {
    auto split = detecting_.split("deer_abc.camera.jpeg");

    EXPECT_EQ(split.name, "deer_abc");
    EXPECT_FALSE(split.frame.has_value());
    EXPECT_FALSE(detecting_.split("_42.jpeg").frame.has_value());
}

TEST_F(SequenceNameTest, JoinPadsFrame) {
    EXPECT_EQ(plain_.join("deer", 3u), "deer_003.camera.jpeg");
    EXPECT_EQ(plain_.join("deer", 1234u), "deer_1234.camera.jpeg");
    EXPECT_EQ(plain_.join("still", std::nullopt), "still.camera.jpeg");
}

TEST_F(SequenceNameTest, SplitThenJoinGivesNormalizedName) {
    auto padded = plain_.split("clip_0007.camera.jpeg", std::string("clip"));
    EXPECT_EQ(padded, (split_name{"clip", 7u}));
    EXPECT_EQ(plain_.join(padded.name, padded.frame), "clip_007.camera.jpeg");

    auto photo = plain_.split("photo.png");
    EXPECT_EQ(plain_.join(photo.name, photo.frame), "photo.camera.jpeg");
}

TEST_F(SequenceNameTest, JoinPathNestsSequences) {
    EXPECT_EQ(plain_.join_path("deer", 3u),
              std::filesystem::path("deer") / "deer_003.camera.jpeg");
    EXPECT_EQ(plain_.join_path("still", std::nullopt),
              std::filesystem::path("still.camera.jpeg"));
}

TEST_F(SequenceNameTest, CustomSuffixAndExtension) {
    sequence_resolver resolver(sequence_options{true, ".radar", ".png"});

    EXPECT_EQ(resolver.join("scan", 5u), "scan_005.radar.png");
    EXPECT_EQ(resolver.split("scan_005.radar.png"), (split_name{"scan", 5u}));
}

}  // namespace edgefirst::sync::test
