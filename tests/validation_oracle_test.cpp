#include <gtest/gtest.h>
#include "test_images.hpp"
#include "../libmender/include/builtin_checks.hpp"
#include "../libmender/include/corruption_classifier.hpp"
#include "../libmender/include/errors.hpp"
#include "../libmender/include/subprocess.hpp"
#include "../libmender/include/validation_oracle.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>

using namespace mender;
using namespace mender::test;
using namespace std::chrono_literals;

namespace {

    class UnavailableCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "flaky_tool"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Expensive; }
        [[nodiscard]] bool supports(ImageFormat) const noexcept override { return true; }
        [[nodiscard]] ValidationVerdict check(const CheckContext&) const override {
            throw CheckUnavailable("tool crashed");
        }
    };

    class AlwaysPassCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "cheap_extra"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Cheap; }
        [[nodiscard]] bool supports(ImageFormat) const noexcept override { return true; }
        [[nodiscard]] ValidationVerdict check(const CheckContext&) const override { return pass(); }
    };

    OracleConfig offline_config() {
        OracleConfig config;
        config.mime_check = false;
        return config;
    }

} // namespace

TEST(ValidationOracleTest, RunsChecksCheapestFirst)
{
    const ValidationOracle oracle(offline_config());
    const auto names = oracle.check_names();

    ASSERT_GE(names.size(), 4u);
    EXPECT_EQ(names[0], "size");
    EXPECT_EQ(names[1], "magic_bytes");
    EXPECT_EQ(names[2], "structure");
    EXPECT_EQ(names[3], "segment_audit");
}

TEST(ValidationOracleTest, ValidJpegPassesEveryCheck)
{
    const ValidationOracle oracle(offline_config());
    const OracleResult result = oracle.validate(make_artifact("a.jpg", make_jpeg(), ImageFormat::Jpeg));

    EXPECT_TRUE(result.parse.ok());
    EXPECT_TRUE(result.passes_required());
    for (const auto& v : result.verdicts) {
        EXPECT_TRUE(v.passed) << v.check_name << ": " << v.diagnostic.value_or("");
    }
    const auto* decode = result.find("jpeg_decode");
    ASSERT_NE(decode, nullptr);
    EXPECT_FALSE(decode->required);
    EXPECT_EQ(result.find("png_decode"), nullptr);
}

TEST(ValidationOracleTest, ValidPngPassesEveryCheck)
{
    const ValidationOracle oracle(offline_config());
    const OracleResult result = oracle.validate(make_artifact("a.png", make_png(), ImageFormat::Png));

    EXPECT_TRUE(result.passes_required());
    ASSERT_NE(result.find("png_decode"), nullptr);
    EXPECT_TRUE(result.find("png_decode")->passed);
}

TEST(ValidationOracleTest, TooSmallArtifactStopsAfterSizeCheck)
{
    const ValidationOracle oracle(offline_config());
    const Bytes tiny{0xFF, 0xD8, 0xFF, 0xE0};
    const OracleResult result = oracle.validate(make_artifact("tiny.jpg", tiny, ImageFormat::Jpeg));

    ASSERT_EQ(result.verdicts.size(), 1u);
    EXPECT_EQ(result.verdicts[0].check_name, "size");
    EXPECT_FALSE(result.verdicts[0].passed);
    EXPECT_TRUE(result.verdicts[0].required);
    EXPECT_FALSE(result.passes_required());
}

TEST(ValidationOracleTest, MalformedContainerStopsAfterStructureCheck)
{
    const ValidationOracle oracle(offline_config());
    const OracleResult result =
        oracle.validate(make_artifact("fake.jpg", text_bytes(std::string(300, 'q')), ImageFormat::Jpeg));

    EXPECT_FALSE(result.parse.ok());
    ASSERT_NE(result.find("structure"), nullptr);
    EXPECT_FALSE(result.find("structure")->passed);
    EXPECT_EQ(result.verdicts.back().check_name, "structure");
}

TEST(ValidationOracleTest, GarbagePrefixFailsMagicAndStructure)
{
    const ValidationOracle oracle(offline_config());
    const OracleResult result =
        oracle.validate(make_artifact("p.jpg", with_garbage_prefix(make_jpeg(), 64), ImageFormat::Jpeg));

    ASSERT_NE(result.find("magic_bytes"), nullptr);
    EXPECT_FALSE(result.find("magic_bytes")->passed);
    ASSERT_TRUE(result.find("magic_bytes")->diagnostic.has_value());
    EXPECT_NE(result.find("magic_bytes")->diagnostic->find("FF D8 FF"), std::string::npos);
    ASSERT_NE(result.find("structure"), nullptr);
    EXPECT_FALSE(result.find("structure")->passed);
    EXPECT_FALSE(result.passes_required());
}

TEST(ValidationOracleTest, TruncatedJpegReportsDecodeProgress)
{
    const ValidationOracle oracle(offline_config());
    const Bytes cut = keep_fraction(make_jpeg(256, 256), 0.4);
    const OracleResult result = oracle.validate(make_artifact("cut.jpg", cut, ImageFormat::Jpeg));

    const auto* decode = result.find("jpeg_decode");
    ASSERT_NE(decode, nullptr);
    EXPECT_FALSE(decode->passed);
    ASSERT_TRUE(decode->progress.has_value());
    EXPECT_EQ(decode->progress->rows_total, 256u);
    EXPECT_LT(decode->progress->rows_decoded, 256u);
    EXPECT_GT(decode->progress->row_group, 1u);

    ASSERT_NE(result.find("structure"), nullptr);
    EXPECT_FALSE(result.find("structure")->passed);
}

TEST(ValidationOracleTest, DisabledDecodeChecksDoNotRun)
{
    OracleConfig config = offline_config();
    config.decode_checks = false;
    const ValidationOracle oracle(config);
    const OracleResult result = oracle.validate(make_artifact("a.jpg", make_jpeg(), ImageFormat::Jpeg));

    EXPECT_EQ(result.find("jpeg_decode"), nullptr);
    EXPECT_TRUE(result.passes_required());
}

TEST(ValidationOracleTest, OversizedJpegFrameFailsDecodeInsteadOfAllocating)
{
    const ValidationOracle oracle(offline_config());
    const auto artifact = make_artifact("huge.jpg", with_jpeg_dimensions(make_jpeg(), 60000, 60000), ImageFormat::Jpeg);
    const OracleResult result = oracle.validate(artifact);

    ASSERT_NE(result.find("structure"), nullptr);
    EXPECT_TRUE(result.find("structure")->passed);
    const auto* decode = result.find("jpeg_decode");
    ASSERT_NE(decode, nullptr);
    EXPECT_FALSE(decode->passed);
    ASSERT_TRUE(decode->diagnostic.has_value());
    EXPECT_NE(decode->diagnostic->find("exceeds the decode limit"), std::string::npos) << *decode->diagnostic;
    EXPECT_FALSE(decode->progress.has_value());

    const CorruptionRecord record = CorruptionClassifier{}.classify(result);
    EXPECT_EQ(record.classification, Classification::Corrupted);
    EXPECT_EQ(record.type, CorruptionType::CorruptData);
}

TEST(ValidationOracleTest, OversizedPngHeaderFailsDecodeInsteadOfAllocating)
{
    const ValidationOracle oracle(offline_config());
    const auto artifact = make_artifact("huge.png", with_png_dimensions(make_png(), 60000, 60000), ImageFormat::Png);
    const OracleResult result = oracle.validate(artifact);

    ASSERT_NE(result.find("structure"), nullptr);
    EXPECT_TRUE(result.find("structure")->passed);
    const auto* decode = result.find("png_decode");
    ASSERT_NE(decode, nullptr);
    EXPECT_FALSE(decode->passed);
    ASSERT_TRUE(decode->diagnostic.has_value());
    EXPECT_NE(decode->diagnostic->find("exceeds the decode limit"), std::string::npos) << *decode->diagnostic;

    const CorruptionRecord record = CorruptionClassifier{}.classify(result);
    EXPECT_EQ(record.classification, Classification::Corrupted);
    EXPECT_EQ(record.type, CorruptionType::CorruptData);
}

TEST(ValidationOracleTest, DecodeLimitIsConfigurable)
{
    OracleConfig config = offline_config();
    config.max_decode_bytes = 1024;
    const ValidationOracle oracle(config);
    const OracleResult result = oracle.validate(make_artifact("a.jpg", make_jpeg(64, 48), ImageFormat::Jpeg));

    const auto* decode = result.find("jpeg_decode");
    ASSERT_NE(decode, nullptr);
    EXPECT_FALSE(decode->passed);
    EXPECT_EQ(decode->diagnostic.value_or(""), oversized_image_message(64, 48, 3, 1024));
}

TEST(ValidationOracleTest, UnavailableCheckIsRecordedWithoutVerdict)
{
    ValidationOracle oracle(offline_config());
    oracle.add_check(std::make_unique<UnavailableCheck>());
    const OracleResult result = oracle.validate(make_artifact("a.jpg", make_jpeg(), ImageFormat::Jpeg));

    EXPECT_EQ(result.find("flaky_tool"), nullptr);
    ASSERT_EQ(result.unavailable.size(), 1u);
    EXPECT_EQ(result.unavailable[0], "flaky_tool");
    EXPECT_TRUE(result.passes_required());
}

TEST(ValidationOracleTest, AddedCheckKeepsCostOrder)
{
    ValidationOracle oracle(offline_config());
    oracle.add_check(std::make_unique<AlwaysPassCheck>());
    const auto names = oracle.check_names();

    auto index_of = [&names](const std::string& name) {
        return std::distance(names.begin(), std::find(names.begin(), names.end(), name));
    };
    ASSERT_LT(index_of("cheap_extra"), static_cast<std::ptrdiff_t>(names.size()));
    EXPECT_GT(index_of("cheap_extra"), index_of("segment_audit"));
    EXPECT_LT(index_of("cheap_extra"), index_of("jpeg_decode"));
}

TEST(ExternalToolCheckTest, ExitStatusDecidesVerdict)
{
    if (find_executable("true").empty() || find_executable("false").empty()) {
        GTEST_SKIP() << "true/false not on PATH";
    }
    const auto artifact = make_artifact("a.jpg", make_jpeg(), ImageFormat::Jpeg);
    const ParseOutcome parse = try_parse(artifact);
    const CheckContext ctx{artifact, parse};

    const ExternalToolCheck ok("ok_tool", "true", {}, {ImageFormat::Jpeg}, 5000ms);
    ASSERT_TRUE(ok.is_available());
    EXPECT_TRUE(ok.check(ctx).passed);

    const ExternalToolCheck bad("bad_tool", "false", {}, {ImageFormat::Jpeg}, 5000ms);
    const ValidationVerdict v = bad.check(ctx);
    EXPECT_FALSE(v.passed);
    ASSERT_TRUE(v.diagnostic.has_value());
    EXPECT_NE(v.diagnostic->find("exit status 1"), std::string::npos);

    EXPECT_FALSE(bad.supports(ImageFormat::Png));
}

TEST(ExternalToolCheckTest, MissingProgramIsUnavailable)
{
    const ExternalToolCheck missing("nope", "mender-no-such-tool-xyz", {}, {ImageFormat::Jpeg}, 1000ms);
    EXPECT_FALSE(missing.is_available());
}

TEST(SubprocessTest, CapturesOutputAndExitCode)
{
    const auto sh = find_executable("sh");
    if (sh.empty()) GTEST_SKIP() << "sh not on PATH";

    const ProcessResult r = run_process({sh.string(), "-c", "echo hello; exit 3"}, 5000ms);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.output, "hello\n");
}

TEST(SubprocessTest, KillsChildOnTimeout)
{
    const auto sh = find_executable("sh");
    if (sh.empty()) GTEST_SKIP() << "sh not on PATH";

    const auto start = std::chrono::steady_clock::now();
    const ProcessResult r = run_process({sh.string(), "-c", "sleep 10"}, 200ms);
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(SubprocessTest, RejectsEmptyArgv)
{
    EXPECT_THROW((void)run_process({}, 100ms), std::invalid_argument);
}
