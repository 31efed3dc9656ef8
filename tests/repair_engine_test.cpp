#include <gtest/gtest.h>
#include "test_images.hpp"
#include "../libmender/include/corruption_classifier.hpp"
#include "../libmender/include/repair_engine.hpp"
#include "../libmender/include/validation_oracle.hpp"
#include <algorithm>
#include <array>
#include <initializer_list>
#include <stop_token>
#include <zlib.h>

using namespace mender;
using namespace mender::test;

namespace {

    class RepairEngineTest : public ::testing::Test
    {
    protected:
        static OracleConfig offline_config() {
            OracleConfig config;
            config.mime_check = false;
            return config;
        }

        struct Classified {
            OracleResult oracle;
            CorruptionRecord record;
        };

        Classified classify(const ImageArtifact& artifact) const {
            Classified c{oracle_.validate(artifact), {}};
            c.record = classifier_.classify(c.oracle);
            return c;
        }

        RepairOutcome repair(const ImageArtifact& artifact) const {
            const Classified c = classify(artifact);
            return engine_.repair(artifact, c.record, c.oracle.parse);
        }

        ValidationOracle oracle_{offline_config()};
        CorruptionClassifier classifier_;
        RepairEngine engine_{oracle_, classifier_};
    };

    /// PNG with a tEXt chunk whose stored CRC is wrong, inserted after IHDR.
    Bytes png_with_bad_text_chunk() {
        const Bytes png = make_png();
        const std::string payload = std::string("Comment") + '\0' + "recovered from unallocated space";
        Bytes chunk{0, 0, 0, static_cast<std::uint8_t>(payload.size()), 't', 'E', 'X', 't'};
        chunk.insert(chunk.end(), payload.begin(), payload.end());
        const auto crc = static_cast<std::uint32_t>(crc32(0L, chunk.data() + 4, static_cast<uInt>(payload.size() + 4)));
        const std::uint32_t wrong = crc ^ 0x0BADF00Du;
        for (const int shift : {24, 16, 8, 0}) {
            chunk.push_back(static_cast<std::uint8_t>(wrong >> shift));
        }

        Bytes out(png.begin(), png.begin() + 33); // signature + IHDR
        out.insert(out.end(), chunk.begin(), chunk.end());
        out.insert(out.end(), png.begin() + 33, png.end());
        return out;
    }

    /// RGB noise; deflate cannot shrink it, so IDAT bytes map almost linearly to rows.
    Bytes noisy_png(const std::uint32_t width, const std::uint32_t height) {
        Bytes px(static_cast<std::size_t>(width) * height * 3);
        std::uint32_t state = 0x2545F491u;
        for (auto& p : px) {
            state = state * 1664525u + 1013904223u;
            p = static_cast<std::uint8_t>(state >> 24);
        }
        return encode_png(px, width, height, 3);
    }

    /// Cut halfway through the data of the first IDAT chunk.
    Bytes cut_inside_first_idat(const Bytes& png) {
        const Segment* idat = parse_png(png).find("IDAT");
        if (idat == nullptr) return png;
        const std::size_t cut = idat->offset + 8 + (idat->length - 12) / 2;
        return {png.begin(), png.begin() + static_cast<std::ptrdiff_t>(cut)};
    }

    /// Scan complete, EOI replaced by a COM segment whose body never arrived.
    Bytes jpeg_ending_in_cut_comment(const Bytes& jpeg) {
        Bytes out = drop_tail(jpeg, 2);
        for (const std::uint8_t b : std::initializer_list<std::uint8_t>{0xFF, 0xFE, 0x00, 0x40, 'c', 'u', 't'}) {
            out.push_back(b);
        }
        return out;
    }

    /// COM segment right after SOI whose declared length is shorter than its body.
    Bytes jpeg_with_short_comment(const Bytes& jpeg) {
        const std::string body = "carved-by-scalpel";
        Bytes out(jpeg.begin(), jpeg.begin() + 2);
        for (const std::uint8_t b : {0xFF, 0xFE, 0x00, 0x08}) {
            out.push_back(b);
        }
        out.insert(out.end(), body.begin(), body.end());
        out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
        return out;
    }

} // namespace

TEST_F(RepairEngineTest, ValidArtifactIsReturnedUntouched)
{
    const Bytes jpeg = make_jpeg();
    const auto artifact = make_artifact("ok.jpg", jpeg, ImageFormat::Jpeg);
    const RepairOutcome outcome = repair(artifact);

    EXPECT_EQ(outcome.status, RepairStatus::NotNeeded);
    EXPECT_TRUE(outcome.attempts.empty());
    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_EQ(outcome.final_artifact->id(), "ok.jpg");
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), jpeg));
    EXPECT_EQ(outcome.final_classification(), Classification::Valid);
}

TEST_F(RepairEngineTest, AppendsMissingJpegEndMarker)
{
    const Bytes original = make_jpeg();
    const auto artifact = make_artifact("nofooter.jpg", drop_tail(original, 2), ImageFormat::Jpeg);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::MissingFooter);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::FooterAppend);
    EXPECT_EQ(outcome.final_classification(), Classification::Valid);

    ASSERT_TRUE(outcome.final_artifact.has_value());
    const auto repaired = outcome.final_artifact->bytes();
    ASSERT_GE(repaired.size(), 2u);
    EXPECT_EQ(repaired[repaired.size() - 2], 0xFF);
    EXPECT_EQ(repaired[repaired.size() - 1], 0xD9);
    EXPECT_TRUE(std::ranges::equal(repaired, original));

    ASSERT_FALSE(outcome.attempts.empty());
    const RepairAttempt& last = outcome.attempts.back();
    EXPECT_TRUE(last.success);
    EXPECT_EQ(last.input_artifact_id, "nofooter.jpg");
    ASSERT_TRUE(last.output.has_value());
    EXPECT_NE(last.output->id(), "nofooter.jpg");
    EXPECT_FALSE(last.output->is_evidence());
    const auto structure = std::ranges::find(last.verdicts_after, std::string("structure"), &ValidationVerdict::check_name);
    ASSERT_NE(structure, last.verdicts_after.end());
    EXPECT_TRUE(structure->passed);

    // evidence bytes are untouched
    EXPECT_EQ(artifact.size(), original.size() - 2);
}

TEST_F(RepairEngineTest, AppendsMissingPngEndChunk)
{
    const Bytes original = make_png();
    const auto artifact = make_artifact("nofooter.png", drop_tail(original, 12), ImageFormat::Png);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::MissingFooter);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), original));
}

TEST_F(RepairEngineTest, StripsExactGarbagePrefix)
{
    constexpr std::size_t kPrefix = 137;
    const Bytes original = make_jpeg();
    const auto artifact = make_artifact("prefixed.jpg", with_garbage_prefix(original, kPrefix), ImageFormat::Jpeg);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::InvalidHeader);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::HeaderReconstruction);
    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_EQ(outcome.final_artifact->size(), artifact.size() - kPrefix);
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), original));

    const auto& after = outcome.attempts.back().verdicts_after;
    const auto decode = std::ranges::find(after, std::string("jpeg_decode"), &ValidationVerdict::check_name);
    ASSERT_NE(decode, after.end());
    EXPECT_TRUE(decode->passed);
}

TEST_F(RepairEngineTest, PrefixBeyondSearchWindowIsNotStripped)
{
    const ValidationOracle oracle(offline_config());
    const RepairEngine narrow(oracle, classifier_, RepairConfig{16, 95});
    const auto artifact = make_artifact("prefixed.jpg", with_garbage_prefix(make_jpeg(), 64), ImageFormat::Jpeg);
    const Classified c = classify(artifact);

    const RepairOutcome outcome = narrow.repair(artifact, c.record, c.oracle.parse);
    ASSERT_FALSE(outcome.attempts.empty());
    EXPECT_EQ(outcome.attempts.front().variant, "strip_prefix");
    EXPECT_FALSE(outcome.attempts.front().success);
}

TEST_F(RepairEngineTest, SynthesizesHeaderWhenStartMarkerIsOutOfReach)
{
    const ValidationOracle oracle(offline_config());
    const RepairEngine narrow(oracle, classifier_, RepairConfig{16, 95});
    const auto artifact = make_artifact("prefixed.jpg", with_garbage_prefix(make_jpeg(), 64), ImageFormat::Jpeg);
    const Classified c = classify(artifact);
    ASSERT_EQ(c.record.type, CorruptionType::InvalidHeader);

    const RepairOutcome outcome = narrow.repair(artifact, c.record, c.oracle.parse);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::HeaderReconstruction);
    EXPECT_EQ(outcome.attempts.back().variant, "synthesize_header");
    EXPECT_EQ(outcome.final_classification(), Classification::Valid);

    ASSERT_TRUE(outcome.final_artifact.has_value());
    const auto repaired = outcome.final_artifact->bytes();
    ASSERT_GE(repaired.size(), 4u);
    EXPECT_EQ(repaired[0], 0xFF);
    EXPECT_EQ(repaired[1], 0xD8);
    const DecodedImage img = decode_jpeg(repaired);
    EXPECT_TRUE(img.complete());
    EXPECT_EQ(img.width, 64u);
    EXPECT_EQ(img.height, 48u);
}

TEST_F(RepairEngineTest, FallsBackToLastBoundaryWhenAppendIsNotEnough)
{
    const Bytes original = make_jpeg();
    const auto artifact = make_artifact("cutcom.jpg", jpeg_ending_in_cut_comment(original), ImageFormat::Jpeg);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::MissingFooter);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::FooterAppend);
    ASSERT_EQ(outcome.attempts.size(), 2u);
    EXPECT_EQ(outcome.attempts[0].variant, "append_end_marker");
    EXPECT_FALSE(outcome.attempts[0].success);
    EXPECT_EQ(outcome.attempts[1].variant, "truncate_and_append");
    EXPECT_TRUE(outcome.attempts[1].success);

    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), original));
}

TEST_F(RepairEngineTest, StripsJpegSegmentWithBadLength)
{
    const Bytes original = make_jpeg();
    const auto artifact = make_artifact("com.jpg", jpeg_with_short_comment(original), ImageFormat::Jpeg);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::CorruptSegments);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::SegmentStripping);
    EXPECT_EQ(outcome.final_classification(), Classification::Valid);
    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), original));
}

TEST_F(RepairEngineTest, StripsCorruptAncillaryChunk)
{
    const auto artifact = make_artifact("text.png", png_with_bad_text_chunk(), ImageFormat::Png);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::CorruptSegments);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::SegmentStripping);
    ASSERT_TRUE(outcome.final_artifact.has_value());
    EXPECT_TRUE(std::ranges::equal(outcome.final_artifact->bytes(), make_png()));
}

TEST_F(RepairEngineTest, SalvagesRowsOfTruncatedJpeg)
{
    const auto artifact = make_artifact("cut.jpg", keep_fraction(make_jpeg(256, 256), 0.4), ImageFormat::Jpeg);
    ASSERT_EQ(classify(artifact).record.type, CorruptionType::Truncated);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::PartialDecodeReencode);
    ASSERT_TRUE(outcome.final_artifact.has_value());

    const DecodedImage img = decode_jpeg(outcome.final_artifact->bytes());
    EXPECT_TRUE(img.complete());
    EXPECT_EQ(img.width, 256u);
    EXPECT_GT(img.height, 0u);
    EXPECT_LT(img.height, 256u);
}

TEST(ImageCodecTest, TruncatedPngKeepsRowsInflatedBeforeTheCut)
{
    const DecodedImage img = decode_png(cut_inside_first_idat(noisy_png(128, 128)));

    EXPECT_TRUE(img.header_ok);
    EXPECT_TRUE(img.data_exhausted);
    EXPECT_FALSE(img.complete());
    EXPECT_GT(img.clean_rows, 0u);
    EXPECT_LT(img.clean_rows, 128u);

    // smooth gradient: the whole image fits in one small IDAT
    const Bytes gradient_png = make_png(256, 256);
    ASSERT_EQ(std::ranges::count(parse_png(gradient_png).segments, std::string("IDAT"), &Segment::kind), 1);
    const DecodedImage small = decode_png(cut_inside_first_idat(gradient_png));
    EXPECT_TRUE(small.header_ok);
    EXPECT_GT(small.clean_rows, 0u);
    EXPECT_LT(small.clean_rows, 256u);
}

TEST_F(RepairEngineTest, SalvagesRowsOfTruncatedPng)
{
    const auto artifact = make_artifact("cut.png", cut_inside_first_idat(noisy_png(128, 128)), ImageFormat::Png);
    const Classified c = classify(artifact);
    ASSERT_EQ(c.record.type, CorruptionType::Truncated);
    const auto* decode = c.oracle.find("png_decode");
    ASSERT_NE(decode, nullptr);
    ASSERT_TRUE(decode->progress.has_value());
    EXPECT_GT(decode->progress->rows_decoded, 0u);

    const RepairOutcome outcome = repair(artifact);
    ASSERT_EQ(outcome.status, RepairStatus::Repaired) << outcome.diagnostic;
    EXPECT_EQ(outcome.technique_used(), RepairTechnique::PartialDecodeReencode);
    ASSERT_TRUE(outcome.final_artifact.has_value());

    const DecodedImage img = decode_png(outcome.final_artifact->bytes());
    EXPECT_TRUE(img.complete());
    EXPECT_EQ(img.width, 128u);
    EXPECT_EQ(img.height, decode->progress->rows_decoded);
}

TEST_F(RepairEngineTest, UnrecoverableIsRejectedWithoutAttempt)
{
    const auto artifact = make_artifact("fake.jpg", text_bytes(std::string(200, 'z')), ImageFormat::Jpeg);
    const RepairOutcome outcome = repair(artifact);

    EXPECT_EQ(outcome.status, RepairStatus::Rejected);
    EXPECT_TRUE(outcome.attempts.empty());
    EXPECT_FALSE(outcome.final_artifact.has_value());
}

TEST_F(RepairEngineTest, TypeWithoutTechniqueFailsWithoutAttempt)
{
    const auto artifact = make_artifact("frag.jpg", make_jpeg(), ImageFormat::Jpeg);
    const Classified c = classify(artifact);
    CorruptionRecord fragmented{Classification::Corrupted, CorruptionType::Fragmented, 4, std::nullopt,
                                Confidence::High};

    const RepairOutcome outcome = engine_.repair(artifact, fragmented, c.oracle.parse);
    EXPECT_EQ(outcome.status, RepairStatus::Failed);
    EXPECT_TRUE(outcome.attempts.empty());
    EXPECT_FALSE(outcome.diagnostic.empty());
}

TEST_F(RepairEngineTest, StopRequestInterruptsBeforeFirstVariant)
{
    const auto artifact = make_artifact("nofooter.jpg", drop_tail(make_jpeg(), 2), ImageFormat::Jpeg);
    const Classified c = classify(artifact);
    std::stop_source source;
    source.request_stop();

    const RepairOutcome outcome = engine_.repair(artifact, c.record, c.oracle.parse, source.get_token());
    EXPECT_EQ(outcome.status, RepairStatus::Failed);
    EXPECT_EQ(outcome.diagnostic, "Interrupted");
    EXPECT_TRUE(outcome.attempts.empty());
}

TEST(RepairTechniqueTest, FactoryCoversEveryTechnique)
{
    const RepairConfig config;
    for (const auto t : {RepairTechnique::FooterAppend, RepairTechnique::HeaderReconstruction,
                         RepairTechnique::SegmentStripping, RepairTechnique::PartialDecodeReencode}) {
        const auto technique = make_technique(t, config);
        ASSERT_NE(technique, nullptr);
        EXPECT_EQ(technique->id(), t);
        EXPECT_GE(technique->variant_count(), 1u);
    }
}

TEST(RepairTechniqueTest, CriticalChunksAreProtected)
{
    EXPECT_TRUE(is_critical_png_chunk("IHDR"));
    EXPECT_TRUE(is_critical_png_chunk("IDAT"));
    EXPECT_FALSE(is_critical_png_chunk("tEXt"));

    EXPECT_TRUE(is_critical_jpeg_segment(Segment{"SOS", 0xDA, 0, 12}));
    EXPECT_TRUE(is_critical_jpeg_segment(Segment{"SOF0", 0xC0, 0, 19}));
    EXPECT_FALSE(is_critical_jpeg_segment(Segment{"APP1", 0xE1, 0, 100}));
}
