#include <gtest/gtest.h>
#include "../libmender/include/corruption_classifier.hpp"

using namespace mender;

namespace {

    ValidationVerdict verdict(const std::string& name, const bool passed, const bool required) {
        return {name, passed, passed ? std::nullopt : std::optional<std::string>("failed"), required, std::nullopt};
    }

    ContainerStructure complete_jpeg_structure() {
        ContainerStructure s;
        s.format = ImageFormat::Jpeg;
        s.has_start_marker = true;
        s.has_end_marker = true;
        s.has_frame_header = true;
        s.has_scan_data = true;
        s.stop_reason = StopReason::EndMarker;
        s.segments = {{"SOI", 0xD8, 0, 2}, {"SOF0", 0xC0, 2, 19}, {"SOS", 0xDA, 21, 14},
                      {"SCAN", 0, 35, 100}, {"EOI", 0xD9, 135, 2}};
        return s;
    }

    /// Oracle result with the given structure; structural verdicts follow from it.
    OracleResult result_for(const ContainerStructure& s, const bool decode_passed = true,
                            std::optional<DecodeProgress> progress = std::nullopt) {
        OracleResult r;
        r.parse.structure = s;
        const bool structure_ok = s.has_start_marker && s.has_end_marker && s.has_frame_header && s.has_scan_data;
        r.verdicts.push_back(verdict("size", true, true));
        r.verdicts.push_back(verdict("magic_bytes", s.has_start_marker, true));
        r.verdicts.push_back(verdict("structure", structure_ok, true));
        r.verdicts.push_back(verdict("segment_audit", s.inconsistent_segments() == 0, false));
        auto decode = verdict("jpeg_decode", decode_passed, false);
        decode.progress = progress;
        r.verdicts.push_back(decode);
        return r;
    }

    ContainerStructure without_end_marker(const bool ended_in_scan) {
        ContainerStructure s = complete_jpeg_structure();
        s.has_end_marker = false;
        s.segments.pop_back();
        s.stop_reason = StopReason::EndOfStream;
        s.ended_in_scan_data = ended_in_scan;
        return s;
    }

} // namespace

TEST(CorruptionClassifierTest, AllPassingIsValid)
{
    const CorruptionClassifier classifier;
    const auto record = classifier.classify(result_for(complete_jpeg_structure()));

    EXPECT_EQ(record.classification, Classification::Valid);
    EXPECT_EQ(record.type, CorruptionType::None);
    EXPECT_EQ(record.tier, 0);
    EXPECT_FALSE(record.technique.has_value());
    EXPECT_EQ(record.confidence, Confidence::High);
}

TEST(CorruptionClassifierTest, MalformedContainerIsUnrecoverable)
{
    OracleResult r;
    r.parse.error = "no JPEG start-of-image marker";
    r.verdicts.push_back(verdict("size", true, true));
    r.verdicts.push_back(verdict("magic_bytes", false, true));
    r.verdicts.push_back(verdict("structure", false, true));

    const auto record = CorruptionClassifier{}.classify(r);
    EXPECT_EQ(record.classification, Classification::Unrecoverable);
    EXPECT_EQ(record.type, CorruptionType::FalsePositive);
    EXPECT_EQ(record.tier, 5);
    EXPECT_FALSE(record.technique.has_value());
}

TEST(CorruptionClassifierTest, FailedSizeCheckIsUnrecoverable)
{
    OracleResult r;
    r.parse.structure = complete_jpeg_structure();
    r.verdicts.push_back(verdict("size", false, true));

    EXPECT_EQ(CorruptionClassifier{}.classify(r).classification, Classification::Unrecoverable);
}

TEST(CorruptionClassifierTest, ShortfallWithinToleranceIsMissingFooter)
{
    // 112 rows, 100 decoded, iMCU rows of 16: 12 missing <= 3 * 16
    const auto r = result_for(without_end_marker(true), false, DecodeProgress{100, 112, 16});
    const auto record = CorruptionClassifier{}.classify(r);

    EXPECT_EQ(record.classification, Classification::Corrupted);
    EXPECT_EQ(record.type, CorruptionType::MissingFooter);
    EXPECT_EQ(record.tier, 1);
    ASSERT_TRUE(record.technique.has_value());
    EXPECT_EQ(*record.technique, RepairTechnique::FooterAppend);
}

TEST(CorruptionClassifierTest, LargeShortfallIsTruncated)
{
    const auto r = result_for(without_end_marker(true), false, DecodeProgress{96, 256, 16});
    const auto record = CorruptionClassifier{}.classify(r);

    EXPECT_EQ(record.type, CorruptionType::Truncated);
    EXPECT_EQ(record.tier, 3);
    ASSERT_TRUE(record.technique.has_value());
    EXPECT_EQ(*record.technique, RepairTechnique::PartialDecodeReencode);
}

TEST(CorruptionClassifierTest, FooterToleranceIsConfigurable)
{
    const auto r = result_for(without_end_marker(true), false, DecodeProgress{100, 112, 16});

    EXPECT_EQ(CorruptionClassifier(ClassifierConfig{0}).classify(r).type, CorruptionType::Truncated);
    EXPECT_EQ(CorruptionClassifier(ClassifierConfig{1}).classify(r).type, CorruptionType::MissingFooter);
}

TEST(CorruptionClassifierTest, CompleteDecodeWithoutEndMarkerIsMissingFooter)
{
    const auto r = result_for(without_end_marker(true), true, DecodeProgress{112, 112, 16});
    EXPECT_EQ(CorruptionClassifier{}.classify(r).type, CorruptionType::MissingFooter);
}

TEST(CorruptionClassifierTest, WithoutDecoderFallsBackToStopPosition)
{
    auto in_scan = result_for(without_end_marker(true));
    in_scan.verdicts.pop_back();
    EXPECT_EQ(CorruptionClassifier{}.classify(in_scan).type, CorruptionType::MissingFooter);

    ContainerStructure cut = without_end_marker(false);
    cut.stop_reason = StopReason::TruncatedSegment;
    auto in_segment = result_for(cut);
    in_segment.verdicts.pop_back();
    EXPECT_EQ(CorruptionClassifier{}.classify(in_segment).type, CorruptionType::Truncated);
}

TEST(CorruptionClassifierTest, MisplacedStartMarkerIsInvalidHeader)
{
    ContainerStructure s = complete_jpeg_structure();
    s.has_start_marker = false;
    s.start_offset = 40;

    const auto record = CorruptionClassifier{}.classify(result_for(s, false));
    EXPECT_EQ(record.type, CorruptionType::InvalidHeader);
    EXPECT_EQ(record.tier, 2);
    ASSERT_TRUE(record.technique.has_value());
    EXPECT_EQ(*record.technique, RepairTechnique::HeaderReconstruction);
}

TEST(CorruptionClassifierTest, EmbeddedStartMarkerIsFragmented)
{
    ContainerStructure s = complete_jpeg_structure();
    s.embedded_start_markers = 1;

    const auto record = CorruptionClassifier{}.classify(result_for(s, false));
    EXPECT_EQ(record.classification, Classification::Corrupted);
    EXPECT_EQ(record.type, CorruptionType::Fragmented);
    EXPECT_EQ(record.tier, 4);
    EXPECT_FALSE(record.technique.has_value());
}

TEST(CorruptionClassifierTest, InconsistentSegmentIsCorruptSegments)
{
    ContainerStructure s = complete_jpeg_structure();
    s.segments[1].intact = false;
    s.segments[1].issue = "declared length does not end at a marker";

    const auto record = CorruptionClassifier{}.classify(result_for(s));
    EXPECT_EQ(record.type, CorruptionType::CorruptSegments);
    EXPECT_EQ(record.tier, 2);
    EXPECT_EQ(record.technique, RepairTechnique::SegmentStripping);
}

TEST(CorruptionClassifierTest, DecodeFailureInIntactContainerIsCorruptData)
{
    const auto record = CorruptionClassifier{}.classify(result_for(complete_jpeg_structure(), false));
    EXPECT_EQ(record.type, CorruptionType::CorruptData);
    EXPECT_EQ(record.tier, 3);
    EXPECT_EQ(record.technique, RepairTechnique::PartialDecodeReencode);
}

TEST(CorruptionClassifierTest, NoFrameAndNoScanIsFalsePositive)
{
    ContainerStructure s;
    s.format = ImageFormat::Jpeg;
    s.has_start_marker = true;
    s.segments = {{"SOI", 0xD8, 0, 2}, {"APP0", 0xE0, 2, 18, false, "declared length does not end at a marker"}};

    const auto record = CorruptionClassifier{}.classify(result_for(s, false));
    EXPECT_EQ(record.classification, Classification::Unrecoverable);
    EXPECT_EQ(record.type, CorruptionType::FalsePositive);
}

TEST(CorruptionClassifierTest, UnavailableChecksLowerConfidence)
{
    auto with_optional = result_for(complete_jpeg_structure());
    with_optional.unavailable.emplace_back("mime_type");
    EXPECT_EQ(CorruptionClassifier{}.classify(with_optional).confidence, Confidence::Medium);

    OracleResult required_only;
    required_only.parse.structure = complete_jpeg_structure();
    required_only.verdicts.push_back(verdict("size", true, true));
    required_only.verdicts.push_back(verdict("magic_bytes", true, true));
    required_only.verdicts.push_back(verdict("structure", true, true));
    required_only.unavailable.emplace_back("jpeg_decode");
    EXPECT_EQ(CorruptionClassifier{}.classify(required_only).confidence, Confidence::Low);
}

TEST(CorruptionClassifierTest, ClassificationIsDeterministic)
{
    const CorruptionClassifier classifier;
    const auto r = result_for(without_end_marker(true), false, DecodeProgress{100, 112, 16});
    EXPECT_EQ(classifier.classify(r), classifier.classify(r));
}

TEST(CorruptionTaxonomyTest, TierAndTechniqueFollowType)
{
    EXPECT_EQ(repairability_tier(CorruptionType::MissingFooter), 1);
    EXPECT_EQ(repairability_tier(CorruptionType::InvalidHeader), 2);
    EXPECT_EQ(repairability_tier(CorruptionType::CorruptSegments), 2);
    EXPECT_EQ(repairability_tier(CorruptionType::CorruptData), 3);
    EXPECT_EQ(repairability_tier(CorruptionType::Truncated), 3);
    EXPECT_EQ(repairability_tier(CorruptionType::Fragmented), 4);
    EXPECT_EQ(repairability_tier(CorruptionType::FalsePositive), 5);
    EXPECT_TRUE(is_repairable_tier(3));
    EXPECT_FALSE(is_repairable_tier(4));
    EXPECT_FALSE(technique_for(CorruptionType::Unknown).has_value());
}

TEST(CorruptionTaxonomyTest, NamesParseBack)
{
    for (const auto type : {CorruptionType::None, CorruptionType::MissingFooter, CorruptionType::Truncated,
                            CorruptionType::InvalidHeader, CorruptionType::CorruptSegments,
                            CorruptionType::CorruptData, CorruptionType::Fragmented,
                            CorruptionType::FalsePositive, CorruptionType::Unknown}) {
        EXPECT_EQ(parse_corruption_type(to_string(type)), type) << to_string(type);
    }
    EXPECT_EQ(to_string(CorruptionType::MissingFooter), "missing_footer");
    EXPECT_EQ(parse_classification("unrecoverable"), Classification::Unrecoverable);
    EXPECT_FALSE(parse_classification("broken").has_value());
}
