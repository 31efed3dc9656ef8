#include <gtest/gtest.h>
#include "test_images.hpp"
#include "../libmender/include/errors.hpp"
#include "../libmender/include/events.hpp"
#include "../libmender/include/file_utils.hpp"
#include "../libmender/include/recovery_pipeline.hpp"
#include <algorithm>
#include <atomic>
#include <map>

using namespace mender;
using namespace mender::test;
namespace fs = std::filesystem;

namespace {

    class RecoveryPipelineTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            evidence_ = tmp_.path() / "evidence";
            output_ = tmp_.path() / "out";
            fs::create_directories(evidence_);
        }

        /// 7 valid images, 2 without their final two bytes, 1 text file posing as a JPEG.
        std::vector<fs::path> write_scenario()
        {
            std::vector<fs::path> paths;
            for (unsigned i = 0; i < 7; ++i) {
                const auto p = evidence_ / ("valid_" + std::to_string(i) + ".jpg");
                write_bytes(p, make_jpeg(64, 48, i));
                paths.push_back(p);
            }
            for (unsigned i = 0; i < 2; ++i) {
                const auto p = evidence_ / ("nofooter_" + std::to_string(i) + ".jpg");
                write_bytes(p, drop_tail(make_jpeg(64, 48, 10 + i), 2));
                paths.push_back(p);
            }
            const auto fake = evidence_ / "fake.jpg";
            write_bytes(fake, text_bytes(std::string(256, 'x')));
            paths.push_back(fake);
            return paths;
        }

        PipelineOptions options() const
        {
            PipelineOptions o;
            o.output_dir = output_;
            o.threads = 4;
            o.oracle.mime_check = false;
            return o;
        }

        TempDir tmp_;
        fs::path evidence_;
        fs::path output_;
    };

} // namespace

TEST_F(RecoveryPipelineTest, ScenarioBatchRepairsBothFooters)
{
    const auto paths = write_scenario();
    EventBus bus;
    RecoveryPipeline pipeline(options(), bus);

    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths, "carved"));

    EXPECT_FALSE(batch.interrupted);
    EXPECT_TRUE(batch.skipped.empty());
    ASSERT_EQ(batch.artifacts.size(), 10u);
    EXPECT_EQ(batch.statistics.total, 10u);
    EXPECT_EQ(batch.statistics.valid, 7u);
    EXPECT_EQ(batch.statistics.corrupted, 2u);
    EXPECT_EQ(batch.statistics.unrecoverable, 1u);
    EXPECT_DOUBLE_EQ(batch.statistics.integrity_score(), 70.0);

    ASSERT_TRUE(batch.decision.has_value());
    EXPECT_EQ(batch.decision->effective_strategy(), Strategy::PerformRepair);

    ASSERT_EQ(batch.repairs.size(), 2u);
    for (const auto& r : batch.repairs) {
        EXPECT_EQ(r.outcome.original_record.type, CorruptionType::MissingFooter);
        EXPECT_EQ(r.outcome.status, RepairStatus::Repaired) << r.outcome.artifact_id;
        ASSERT_TRUE(r.output_path.has_value());
        EXPECT_TRUE(fs::exists(*r.output_path));
        EXPECT_EQ(r.output_path->parent_path(), output_ / "repaired");
        const Bytes written = read_file_bytes(*r.output_path);
        ASSERT_GE(written.size(), 2u);
        EXPECT_EQ(written[written.size() - 2], 0xFF);
        EXPECT_EQ(written.back(), 0xD9);
    }

    const FinalCounts counts = batch.final_counts();
    EXPECT_EQ(counts.valid, 9u);
    EXPECT_EQ(counts.corrupted, 0u);
    EXPECT_EQ(counts.unrecoverable, 1u);

    ASSERT_EQ(batch.repair_skipped.size(), 1u);
    EXPECT_EQ(batch.repair_skipped[0].id, "fake.jpg");
    EXPECT_TRUE(temp_leftovers(tmp_.path()).empty());
}

TEST_F(RecoveryPipelineTest, ArtifactsAreSortedById)
{
    const auto paths = write_scenario();
    EventBus bus;
    RecoveryPipeline pipeline(options(), bus);
    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths));

    EXPECT_TRUE(std::ranges::is_sorted(batch.artifacts, {}, [](const ClassifiedArtifact& c) {
        return c.artifact.id();
    }));
}

TEST_F(RecoveryPipelineTest, EvidenceFilesAreNeverModified)
{
    const auto paths = write_scenario();
    std::map<fs::path, Bytes> before;
    for (const auto& p : paths) {
        before[p] = read_file_bytes(p);
    }

    EventBus bus;
    RecoveryPipeline pipeline(options(), bus);
    (void)pipeline.run(RecoveryPipeline::inputs_from_paths(paths));

    for (const auto& p : paths) {
        EXPECT_EQ(read_file_bytes(p), before[p]) << p;
    }
}

TEST_F(RecoveryPipelineTest, DryRunWritesNothing)
{
    const auto paths = write_scenario();
    PipelineOptions o = options();
    o.dry_run = true;
    EventBus bus;
    RecoveryPipeline pipeline(o, bus);

    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths));
    EXPECT_EQ(batch.repairs.size(), 2u);
    for (const auto& r : batch.repairs) {
        EXPECT_FALSE(r.output_path.has_value());
    }
    EXPECT_FALSE(fs::exists(output_ / "repaired"));
}

TEST_F(RecoveryPipelineTest, ValidateOnlyStopsAfterClassification)
{
    const auto paths = write_scenario();
    PipelineOptions o = options();
    o.repair = false;
    EventBus bus;
    RecoveryPipeline pipeline(o, bus);

    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths));
    EXPECT_EQ(batch.artifacts.size(), 10u);
    EXPECT_FALSE(batch.decision.has_value());
    EXPECT_TRUE(batch.repairs.empty());
}

TEST_F(RecoveryPipelineTest, UnreadableAndUnsupportedInputsAreSkipped)
{
    const auto good = evidence_ / "good.jpg";
    write_bytes(good, make_jpeg());
    const auto notes = evidence_ / "notes.txt";
    write_bytes(notes, text_bytes("shopping list: milk, eggs, bread, coffee, more coffee"));

    std::vector<InputRecord> inputs{
        {"good.jpg", good, ""},
        {"missing.jpg", evidence_ / "missing.jpg", ""},
        {"notes.txt", notes, ""},
    };
    EventBus bus;
    std::atomic<int> skipped_events{0};
    bus.subscribe<ArtifactSkippedEvent>([&](const ArtifactSkippedEvent&) { ++skipped_events; });

    RecoveryPipeline pipeline(options(), bus);
    const BatchResult batch = pipeline.run(inputs);

    ASSERT_EQ(batch.artifacts.size(), 1u);
    ASSERT_EQ(batch.skipped.size(), 2u);
    EXPECT_EQ(skipped_events.load(), 2);
    EXPECT_EQ(batch.skipped[0].id, "missing.jpg");
    EXPECT_NE(batch.skipped[0].reason.find("Unreadable"), std::string::npos);
    EXPECT_EQ(batch.skipped[1].id, "notes.txt");
    EXPECT_EQ(batch.skipped[1].reason, "Unsupported format");
}

TEST_F(RecoveryPipelineTest, OversizedFrameIsClassifiedNotSkipped)
{
    const auto huge = evidence_ / "huge.jpg";
    write_bytes(huge, with_jpeg_dimensions(make_jpeg(), 60000, 60000));
    EventBus bus;
    RecoveryPipeline pipeline(options(), bus);

    const BatchResult batch = pipeline.run({{"huge.jpg", huge, "carved"}});
    EXPECT_TRUE(batch.skipped.empty());
    ASSERT_EQ(batch.artifacts.size(), 1u);
    EXPECT_EQ(batch.artifacts[0].record.classification, Classification::Corrupted);
    EXPECT_EQ(batch.artifacts[0].record.type, CorruptionType::CorruptData);
    for (const auto& r : batch.repairs) {
        EXPECT_NE(r.outcome.status, RepairStatus::Repaired);
    }
}

TEST_F(RecoveryPipelineTest, PublishesProgressEvents)
{
    const auto paths = write_scenario();
    EventBus bus;
    std::atomic<int> classified{0};
    std::atomic<int> repaired{0};
    std::atomic<int> decisions{0};
    bus.subscribe<ArtifactClassifiedEvent>([&](const ArtifactClassifiedEvent& e) {
        EXPECT_EQ(e.total, 10u);
        ++classified;
    });
    bus.subscribe<BatchDecisionEvent>([&](const BatchDecisionEvent& e) {
        EXPECT_DOUBLE_EQ(e.integrity_score, 70.0);
        ++decisions;
    });
    bus.subscribe<RepairCompleteEvent>([&](const RepairCompleteEvent& e) {
        EXPECT_EQ(e.total, 2u);
        ++repaired;
    });

    RecoveryPipeline pipeline(options(), bus);
    (void)pipeline.run(RecoveryPipeline::inputs_from_paths(paths));

    EXPECT_EQ(classified.load(), 10);
    EXPECT_EQ(decisions.load(), 1);
    EXPECT_EQ(repaired.load(), 2);
}

TEST_F(RecoveryPipelineTest, ManualOverrideSkipsRepair)
{
    const auto paths = write_scenario();
    PipelineOptions o = options();
    o.manual_override = ManualOverride{Strategy::SkipRepair, "originals only for this case", "examiner"};
    EventBus bus;
    RecoveryPipeline pipeline(o, bus);

    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths));
    ASSERT_TRUE(batch.decision.has_value());
    EXPECT_EQ(batch.decision->automatic.strategy, Strategy::PerformRepair);
    EXPECT_EQ(batch.decision->effective_strategy(), Strategy::SkipRepair);
    EXPECT_TRUE(batch.repairs.empty());
    EXPECT_EQ(batch.repair_skipped.size(), 3u);
}

TEST_F(RecoveryPipelineTest, StopBeforeRunMarksBatchInterrupted)
{
    const auto paths = write_scenario();
    EventBus bus;
    RecoveryPipeline pipeline(options(), bus);
    pipeline.request_stop();

    const BatchResult batch = pipeline.run(RecoveryPipeline::inputs_from_paths(paths));
    EXPECT_TRUE(batch.interrupted);
    EXPECT_TRUE(batch.repairs.empty());
    EXPECT_EQ(batch.artifacts.size() + batch.skipped.size(), 10u);
}

TEST(InputsFromPathsTest, DeduplicatesFileNames)
{
    const auto inputs = RecoveryPipeline::inputs_from_paths(
        {"/b/img.jpg", "/a/img.jpg", "/a/other.png"}, "fs_based");

    ASSERT_EQ(inputs.size(), 3u);
    EXPECT_EQ(inputs[0].id, "img.jpg");
    EXPECT_EQ(inputs[0].path, fs::path("/a/img.jpg"));
    EXPECT_EQ(inputs[1].id, "other.png");
    EXPECT_EQ(inputs[2].id, "img_1.jpg");
    EXPECT_EQ(inputs[2].path, fs::path("/b/img.jpg"));
    EXPECT_EQ(inputs[2].recovery_method, "fs_based");
}

TEST(AtomicWriteTest, LeavesNoTemporaryFileOnSuccess)
{
    const TempDir tmp;
    const auto dest = tmp.path() / "nested" / "out.bin";
    const Bytes data{1, 2, 3, 4, 5};

    write_file_atomic(dest, data);

    EXPECT_EQ(read_file_bytes(dest), data);
    EXPECT_TRUE(temp_leftovers(tmp.path()).empty());
}

TEST(AtomicWriteTest, LeavesNoTemporaryFileOnFailure)
{
    const TempDir tmp;
    // the destination is an existing directory, so the final rename fails
    const auto dest = tmp.path() / "taken";
    fs::create_directories(dest / "child");
    const Bytes data{9, 9, 9};

    EXPECT_THROW(write_file_atomic(dest, data), FatalPipelineError);
    EXPECT_TRUE(temp_leftovers(tmp.path()).empty());
    EXPECT_TRUE(fs::is_directory(dest));
}

TEST(AtomicWriteTest, UniqueDestinationAddsSuffix)
{
    const TempDir tmp;
    write_bytes(tmp.path() / "a.jpg", {1});
    write_bytes(tmp.path() / "a_1.jpg", {1});

    EXPECT_EQ(unique_destination(tmp.path(), "a.jpg"), tmp.path() / "a_2.jpg");
    EXPECT_EQ(unique_destination(tmp.path(), "b.jpg"), tmp.path() / "b.jpg");
}
