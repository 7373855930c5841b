/**
 * @file test_annotation_codec.cpp
 * @brief Unit tests for sample and table conversion
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/codec/annotation_codec.h>

#include <limits>

namespace edgefirst::sync::test {

class AnnotationCodecTest : public ::testing::Test {
protected:
    static auto box_annotation(std::string label, float left = 0.25F) -> annotation {
        annotation ann;
        ann.label = std::move(label);
        ann.box = box2d{left, 0.5F, 0.25F, 0.25F};
        return ann;
    }

    static auto sequence_sample() -> sample {
        sample s;
        s.image_name = "deer_003.camera.jpeg";
        s.sequence_name = "deer";
        s.group = "train";
        s.size = image_size{1920, 1080};
        s.location = gps_location{45.5F, -73.5F};
        s.pose = orientation{0.5F, 0.25F, 0.0F};
        s.degradation = "none";

        auto first = box_annotation("deer");
        first.object_id = "obj-1";
        first.label_index = 0u;
        first.cuboid = box3d{1.0F, 2.0F, 3.0F, 0.5F, 1.0F, 1.5F};
        first.segmentation = mask{{polygon{{0.25F, 0.5F}, {0.5F, 0.5F}, {0.5F, 0.75F}},
                                   polygon{{0.0F, 0.0F}, {0.125F, 0.125F}}}};
        s.annotations.push_back(first);
        s.annotations.push_back(box_annotation("fox", 0.5F));
        return s;
    }

    static auto still_sample() -> sample {
        sample s;
        s.image_name = "still.camera.jpeg";
        s.group = "val";
        return s;
    }
};

TEST_F(AnnotationCodecTest, SampleWithoutAnnotationsGivesOneRow) {
    sample s;
    s.image_name = "s1_003.camera.jpeg";
    s.sequence_name = "s1";
    s.group = "train";

    auto table = samples_to_table({s});

    ASSERT_TRUE(table.has_value()) << table.error().describe();
    ASSERT_EQ(table.value().row_count(), 1u);
    auto row = table.value().row(0);
    EXPECT_EQ(row.name, "s1");
    EXPECT_EQ(row.frame, std::optional<uint32_t>(3));
    EXPECT_EQ(row.group, std::optional<std::string>("train"));
    EXPECT_TRUE(row.is_sample_only());
}

TEST_F(AnnotationCodecTest, OneRowPerAnnotation) {
    auto table = samples_to_table({sequence_sample(), still_sample()});

    ASSERT_TRUE(table.has_value()) << table.error().describe();
    ASSERT_EQ(table.value().row_count(), 3u);

    auto first = table.value().row(0);
    EXPECT_EQ(first.name, "deer");
    EXPECT_EQ(first.object_id, std::optional<std::string>("obj-1"));
    ASSERT_TRUE(first.box2d.has_value());
    EXPECT_FLOAT_EQ((*first.box2d)[0], 0.375F);
    EXPECT_FLOAT_EQ((*first.box2d)[1], 0.625F);
    ASSERT_TRUE(first.size.has_value());
    EXPECT_EQ(*first.size, (std::vector<uint32_t>{1920, 1080}));
    ASSERT_TRUE(first.mask.has_value());
    EXPECT_EQ(first.mask->size(), 11u);

    // Sample-level values repeat on every row of the sample
    auto second = table.value().row(1);
    EXPECT_EQ(second.label, std::optional<std::string>("fox"));
    EXPECT_EQ(second.group, first.group);
    EXPECT_EQ(second.location, first.location);
    EXPECT_FALSE(second.mask.has_value());

    auto third = table.value().row(2);
    EXPECT_EQ(third.name, "still");
    EXPECT_FALSE(third.frame.has_value());
    EXPECT_TRUE(third.is_sample_only());
}

TEST_F(AnnotationCodecTest, RoundTripPreservesSamples) {
    std::vector<sample> samples{sequence_sample(), still_sample()};

    auto table = samples_to_table(samples);
    ASSERT_TRUE(table.has_value());
    auto back = table_to_samples(table.value());

    ASSERT_TRUE(back.has_value()) << back.error().describe();
    ASSERT_EQ(back.value().size(), 2u);
    EXPECT_EQ(back.value()[0], samples[0]);
    EXPECT_EQ(back.value()[1], samples[1]);
}

TEST_F(AnnotationCodecTest, EdgeBoxesSurviveRoundTrip) {
    auto s = still_sample();
    for (const auto& box : {box2d{0.0F, 0.0F, 1.0F, 1.0F}, box2d{0.5F, 0.5F, 0.5F, 0.5F},
                            box2d{0.75F, 0.0F, 0.25F, 1.0F}, box2d{1.0F, 1.0F, 0.0F, 0.0F}}) {
        annotation ann;
        ann.label = "edge";
        ann.box = box;
        s.annotations.push_back(ann);
    }

    auto table = samples_to_table({s});
    ASSERT_TRUE(table.has_value()) << table.error().describe();
    auto back = table_to_samples(table.value());

    ASSERT_TRUE(back.has_value()) << back.error().describe();
    ASSERT_EQ(back.value().size(), 1u);
    EXPECT_EQ(back.value()[0], s);
}

TEST_F(AnnotationCodecTest, BoxOverhangingTheImageRejectedWhenWriting) {
    auto s = still_sample();
    auto ann = box_annotation("overhang");
    ann.box = box2d{0.8F, 0.8F, 0.5F, 0.5F};
    s.annotations.push_back(ann);

    auto table = samples_to_table({s});

    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::validation_failed);
    EXPECT_NE(table.error().message.find("box2d"), std::string::npos);
}

TEST_F(AnnotationCodecTest, InexactValuesRoundTripWithinFloatToleranceAndStabilize) {
    auto s = still_sample();
    annotation ann;
    ann.label = "deer";
    ann.box = box2d{0.1F, 0.3F, 0.7F, 0.3F};
    ann.segmentation = mask{{polygon{{0.1F, 0.3F}, {0.7F, 0.3F}, {0.7F, 0.9F}}}};
    s.annotations.push_back(ann);
    s.location = gps_location{45.1F, -73.7F};

    auto table = samples_to_table({s});
    ASSERT_TRUE(table.has_value()) << table.error().describe();
    auto first = table_to_samples(table.value());
    ASSERT_TRUE(first.has_value()) << first.error().describe();
    ASSERT_EQ(first.value().size(), 1u);
    ASSERT_EQ(first.value()[0].annotations.size(), 1u);

    const auto& box = *first.value()[0].annotations[0].box;
    EXPECT_NEAR(box.left, 0.1F, 1e-6F);
    EXPECT_NEAR(box.top, 0.3F, 1e-6F);
    EXPECT_FLOAT_EQ(box.width, 0.7F);
    EXPECT_FLOAT_EQ(box.height, 0.3F);
    EXPECT_EQ(first.value()[0].annotations[0].segmentation, ann.segmentation);
    EXPECT_EQ(first.value()[0].location, s.location);

    // A second pass reproduces the first exactly
    auto again = samples_to_table(first.value());
    ASSERT_TRUE(again.has_value()) << again.error().describe();
    auto second = table_to_samples(again.value());
    ASSERT_TRUE(second.has_value()) << second.error().describe();
    EXPECT_EQ(second.value(), first.value());
}

TEST_F(AnnotationCodecTest, EmptyAnnotationsEmitNoRow) {
    auto s = still_sample();
    s.annotations.push_back(annotation{});
    s.annotations.push_back(box_annotation("car"));

    auto table = samples_to_table({s});

    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().row_count(), 1u);
    EXPECT_EQ(table.value().row(0).label, std::optional<std::string>("car"));
}

TEST_F(AnnotationCodecTest, InvalidAnnotationCollectedInBatchMode) {
    auto s = still_sample();
    s.annotations.push_back(box_annotation("ok"));
    auto bad = box_annotation("bad");
    bad.box->left = 1.5F;
    s.annotations.push_back(bad);

    annotation_codec codec;
    auto table = codec.to_table({s});

    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table.value().row_count(), 1u);
    ASSERT_EQ(codec.report().size(), 1u);
    const auto& issue = codec.report().issues[0];
    EXPECT_EQ(issue.code, error_code::invalid_geometry);
    EXPECT_EQ(issue.field, "box2d");
    EXPECT_EQ(issue.sample_index, std::optional<std::size_t>(0));
    EXPECT_EQ(issue.annotation_index, std::optional<std::size_t>(1));
    EXPECT_EQ(issue.describe().rfind("sample 0, annotation 1: box2d: ", 0), 0u);
}

TEST_F(AnnotationCodecTest, AllAnnotationsInvalidKeepsSample) {
    auto s = still_sample();
    auto bad = box_annotation("bad");
    bad.box->width = std::numeric_limits<float>::infinity();
    s.annotations.push_back(bad);

    annotation_codec codec;
    auto table = codec.to_table({s});

    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().row_count(), 1u);
    EXPECT_TRUE(table.value().row(0).is_sample_only());
    EXPECT_FALSE(codec.report().ok());
}

TEST_F(AnnotationCodecTest, FailFastStopsAtFirstIssue) {
    auto s = still_sample();
    auto bad = box_annotation("bad");
    bad.box->top = -0.5F;
    s.annotations.push_back(bad);
    s.annotations.push_back(bad);

    annotation_codec codec(codec_options{true});
    auto table = codec.to_table({s});

    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::invalid_geometry);
    EXPECT_EQ(codec.report().size(), 1u);
}

TEST_F(AnnotationCodecTest, StrictConversionSummarizesIssues) {
    sample unnamed;
    auto s = still_sample();
    auto bad = box_annotation("bad");
    bad.box->left = 2.0F;
    s.annotations.push_back(bad);

    auto table = samples_to_table({unnamed, s});

    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::validation_failed);
    EXPECT_EQ(table.error().message.rfind("2 validation issues: ", 0), 0u);
    EXPECT_NE(table.error().message.find("sample 0: name: "), std::string::npos);
}

TEST_F(AnnotationCodecTest, DetectionSplitsUnknownSequences) {
    sample s;
    s.image_name = "walk_012.camera.jpeg";

    codec_options options;
    options.sequences.detect_sequences = true;
    auto table = samples_to_table({s}, options);

    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table.value().row(0).name, "walk");
    EXPECT_EQ(table.value().row(0).frame, std::optional<uint32_t>(12));

    auto plain = samples_to_table({s});
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain.value().row(0).name, "walk_012");
    EXPECT_FALSE(plain.value().row(0).frame.has_value());
}

TEST_F(AnnotationCodecTest, RowsGroupedInFirstAppearanceOrder) {
    annotation_table table;
    table_row a;
    a.name = "b";
    a.label = "x";
    table_row b;
    b.name = "a";
    b.label = "y";
    table_row c = a;
    c.label = "z";
    table.append(a);
    table.append(b);
    table.append(c);

    auto samples = table_to_samples(table);

    ASSERT_TRUE(samples.has_value());
    ASSERT_EQ(samples.value().size(), 2u);
    EXPECT_EQ(samples.value()[0].image_name, "b.camera.jpeg");
    ASSERT_EQ(samples.value()[0].annotations.size(), 2u);
    EXPECT_EQ(samples.value()[0].annotations[1].label, std::optional<std::string>("z"));
    EXPECT_FALSE(samples.value()[0].sequence_name.has_value());
}

TEST_F(AnnotationCodecTest, SameNameDifferentFramesAreDistinct) {
    annotation_table table;
    table_row first;
    first.name = "deer";
    first.frame = 1u;
    table_row second = first;
    second.frame = 2u;
    table.append(first);
    table.append(second);

    auto samples = table_to_samples(table);

    ASSERT_TRUE(samples.has_value());
    ASSERT_EQ(samples.value().size(), 2u);
    EXPECT_EQ(samples.value()[1].image_name, "deer_002.camera.jpeg");
    EXPECT_EQ(samples.value()[1].sequence_name, std::optional<std::string>("deer"));
    EXPECT_TRUE(samples.value()[1].annotations.empty());
}

TEST_F(AnnotationCodecTest, ConflictingSampleValuesReported) {
    annotation_table table;
    table_row first;
    first.name = "img";
    first.group = "train";
    first.label = "a";
    table_row second = first;
    second.group = "val";
    table.append(first);
    table.append(second);

    annotation_codec codec;
    auto samples = codec.to_samples(table);

    ASSERT_TRUE(samples.has_value());
    ASSERT_EQ(codec.report().size(), 1u);
    EXPECT_EQ(codec.report().issues[0].code, error_code::invalid_row_grouping);
    EXPECT_EQ(codec.report().issues[0].row_index, std::optional<std::size_t>(1));
    EXPECT_EQ(samples.value()[0].group, std::optional<std::string>("train"));

    auto strict = table_to_samples(table);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, error_code::validation_failed);
}

TEST_F(AnnotationCodecTest, MissingValueAdoptedFromLaterRow) {
    annotation_table table;
    table_row first;
    first.name = "img";
    first.label = "a";
    table_row second = first;
    second.degradation = "blur";
    table.append(first);
    table.append(second);

    auto samples = table_to_samples(table);

    ASSERT_TRUE(samples.has_value());
    EXPECT_EQ(samples.value()[0].degradation, std::optional<std::string>("blur"));
}

TEST_F(AnnotationCodecTest, InvalidGeometryRowSkipped) {
    annotation_table table;
    table_row good;
    good.name = "img";
    good.label = "a";
    table_row bad = good;
    bad.box2d = std::vector<float>{0.5F, 0.5F};
    table_row odd_mask = good;
    odd_mask.mask = std::vector<float>{0.1F, 0.2F, 0.3F};
    table.append(good);
    table.append(bad);
    table.append(odd_mask);

    annotation_codec codec;
    auto samples = codec.to_samples(table);

    ASSERT_TRUE(samples.has_value());
    EXPECT_EQ(samples.value()[0].annotations.size(), 1u);
    ASSERT_EQ(codec.report().size(), 2u);
    EXPECT_EQ(codec.report().issues[0].field, "box2d");
    EXPECT_EQ(codec.report().issues[1].field, "mask");
}

TEST_F(AnnotationCodecTest, BadSizeArityReported) {
    annotation_table table;
    table_row row;
    row.name = "img";
    row.size = std::vector<uint32_t>{640};
    table.append(row);

    annotation_codec codec;
    auto samples = codec.to_samples(table);

    ASSERT_TRUE(samples.has_value());
    EXPECT_FALSE(samples.value()[0].size.has_value());
    ASSERT_EQ(codec.report().size(), 1u);
    EXPECT_EQ(codec.report().issues[0].field, "size");
}

TEST_F(AnnotationCodecTest, ShapeMismatchIsError) {
    annotation_table table;
    table_row row;
    row.name = "img";
    table.append(row);
    table.pose.clear();

    auto samples = table_to_samples(table);

    ASSERT_FALSE(samples.has_value());
    EXPECT_EQ(samples.error().code, error_code::invalid_row_grouping);
}

TEST_F(AnnotationCodecTest, ReportSummary) {
    validation_report report;
    EXPECT_EQ(report.summary(), "no validation issues");

    validation_issue issue;
    issue.row_index = 4;
    issue.field = "mask";
    issue.message = "bad";
    report.issues.push_back(issue);
    EXPECT_EQ(report.summary(), "1 validation issue: row 4: mask: bad");
}

}  // namespace edgefirst::sync::test
