// Repository: V3CDash
// Component: Pipeline Runner Contract Tests
// Purpose: End-to-end runs with an in-process encoder: per-identity failure
//          isolation, run report, multiplexing, stage toggles, fatal
//          configuration and cancellation.
// Copyright (c) 2025 V3CDash Contributors

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "SyntheticContainer.hpp"
#include "TempDir.hpp"
#include "segment_index_v1.pb.h"
#include "v3cdash/encode/JobPlanner.hpp"
#include "v3cdash/pipeline/PipelineRunner.hpp"
#include "v3cdash/pipeline/RunJournal.hpp"
#include "v3cdash/segment/SegmentIndex.hpp"
#include "v3cdash/segment/SegmentLayout.hpp"
#include "v3cdash/util/Logger.hpp"
#include "v3cdash/util/ProtoJson.hpp"

namespace v3cdash::pipeline {
namespace {

using encode::EncodeJob;
using encode::EncodeOutcome;
using segment::JoinPath;
using test::Exists;
using test::TempDir;

// Writes a synthetic container with one GoF per encoder_gof frames.
class ContainerWritingLauncher : public encode::IEncoderLauncher {
 public:
  void FailIdentity(const std::string& name) { fail_.insert(name); }
  void CorruptIdentity(const std::string& name) { corrupt_.insert(name); }

  EncodeOutcome Encode(const EncodeJob& job, const std::atomic<bool>&) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(job);
    }
    if (fail_.count(job.Name()) > 0) return EncodeOutcome::Failed("encoder exit code 1");
    if (corrupt_.count(job.Name()) > 0) {
      if (!test::WriteRawFile(job.output_path, "garbage")) {
        return EncodeOutcome::Failed("cannot write " + job.output_path);
      }
      return EncodeOutcome::Succeeded(job.output_path);
    }
    test::SyntheticContainerSpec spec;
    spec.gof_count = test::GofsForFrames(job.tile.frame_count, job.encoder_gof);
    if (!test::WriteContainerFile(job.output_path, spec)) {
      return EncodeOutcome::Failed("cannot write " + job.output_path);
    }
    return EncodeOutcome::Succeeded(job.output_path);
  }

  std::vector<EncodeJob> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  std::set<std::string> fail_;
  std::set<std::string> corrupt_;
  mutable std::mutex mutex_;
  std::vector<EncodeJob> calls_;
};

class PipelineRunnerContractTest : public ::testing::Test {
 protected:
  PipelineRunnerContractTest()
      : dir_("runner"), launcher_(std::make_shared<ContainerWritingLauncher>()) {
    config_.project_name = "proj";
    config_.tiles_root = dir_.Join("tiles");
    config_.encoded_root = dir_.Join("encoded");
    config_.segmented_root = dir_.Join("v3c");
    config_.combined_root = dir_.Join("v3c_combined");
    config_.logs_dir = dir_.Join("logs");
    config_.gof_plan = GofPlan{16, 16};
    config_.parallelism = 2;
    config_.triplets = {QualityTriplet{24, 32, 43}, QualityTriplet{28, 36, 45}};
    WriteTile(0, 40);
    WriteTile(1, 40);
  }

  void WriteTile(int id, int frames) {
    const std::string tile_dir = dir_.Join("tiles/proj/tile_" + std::to_string(id));
    for (int n = 0; n < frames; ++n) {
      char name[64];
      std::snprintf(name, sizeof(name), "frame_vox10_%04d.ply", n);
      ASSERT_TRUE(test::WriteRawFile(JoinPath(tile_dir, name), "ply\n"));
    }
  }

  BitstreamIdentity Identity(int tile, size_t quality) const {
    return BitstreamIdentity{"proj", tile, config_.triplets[quality]};
  }

  RunSummary Run() {
    PipelineRunner runner(config_, launcher_);
    return runner.Run();
  }

  bool ReadReport(index::v1::RunReport* report) {
    std::string error;
    return util::ReadMessageJsonFile(PipelineRunner::ReportPathFor(config_), report, &error);
  }

  TempDir dir_;
  PipelineConfig config_;
  std::shared_ptr<ContainerWritingLauncher> launcher_;
};

// =============================================================================
// Degraded runs
// =============================================================================

TEST_F(PipelineRunnerContractTest, CorruptContainerFailsOnlyThatIdentity) {
  const BitstreamIdentity bad = Identity(1, 0);
  launcher_->CorruptIdentity(bad.Name());

  RunSummary summary = Run();
  EXPECT_FALSE(summary.fatal);
  EXPECT_TRUE(summary.degraded);
  EXPECT_EQ(summary.ExitCode(), kExitDegraded);
  EXPECT_EQ(summary.identities, 4u);
  EXPECT_EQ(summary.published, 3u);
  EXPECT_EQ(summary.failed, 1u);

  for (int tile = 0; tile < 2; ++tile) {
    for (size_t q = 0; q < 2; ++q) {
      const auto identity = Identity(tile, q);
      const std::string dir = PipelineRunner::SegmentDirFor(config_, identity);
      if (identity.Name() == bad.Name()) {
        EXPECT_FALSE(Exists(dir));
      } else {
        EXPECT_TRUE(Exists(JoinPath(dir, segment::kIndexFileName))) << dir;
        EXPECT_TRUE(Exists(JoinPath(dir, "geom/segment_0003.bin"))) << dir;
      }
    }
  }

  index::v1::RunReport report;
  ASSERT_TRUE(ReadReport(&report));
  EXPECT_TRUE(report.degraded());
  EXPECT_FALSE(report.cancelled());
  EXPECT_EQ(report.published_identities_size(), 3);
  ASSERT_EQ(report.failed_identities_size(), 1);
  EXPECT_EQ(report.failed_identities(0), bad.Name());
  EXPECT_EQ(report.budget().max_concurrent_encodes(), 2);
  bool found = false;
  for (const auto& outcome : report.outcomes()) {
    if (outcome.identity() != bad.Name()) continue;
    found = true;
    EXPECT_EQ(outcome.stage(), "SEGMENT");
    EXPECT_EQ(outcome.error(), "SEGMENTATION_FAILURE");
  }
  EXPECT_TRUE(found);

  EXPECT_TRUE(Exists(JoinPath(summary.run_log_dir, "run.log")));
  const auto journal = RunJournal::Replay(JoinPath(summary.run_log_dir, kJournalFileName));
  EXPECT_GE(journal.size(), 8u);  // encode + segment outcome per identity
}

TEST_F(PipelineRunnerContractTest, EncodeFailureRemovesEarlierSegments) {
  ASSERT_EQ(Run().ExitCode(), kExitOk);
  const BitstreamIdentity bad = Identity(0, 1);
  const std::string dir = PipelineRunner::SegmentDirFor(config_, bad);
  ASSERT_TRUE(Exists(dir));

  launcher_->FailIdentity(bad.Name());
  RunSummary summary = Run();
  EXPECT_EQ(summary.ExitCode(), kExitDegraded);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_FALSE(Exists(dir));
  EXPECT_TRUE(Exists(PipelineRunner::SegmentDirFor(config_, Identity(0, 0))));
}

// =============================================================================
// Complete runs
// =============================================================================

TEST_F(PipelineRunnerContractTest, JobsCarryResolvedParameters) {
  config_.parallelism = 4;
  config_.threads_per_instance = 3;
  std::vector<std::string> info;
  std::mutex info_mutex;
  util::Logger::SetInfoSink([&](const std::string& line) {
    std::lock_guard<std::mutex> lock(info_mutex);
    info.push_back(line);
  });
  RunSummary summary = Run();
  util::Logger::SetInfoSink(nullptr);
  ASSERT_EQ(summary.ExitCode(), kExitOk);
  ASSERT_FALSE(info.empty());
  EXPECT_EQ(info.back().rfind("[PipelineRunner] RUN_DONE identities=4 published=4 failed=0", 0),
            0u);

  const auto calls = launcher_->calls();
  ASSERT_EQ(calls.size(), 4u);
  std::set<std::string> names;
  for (const auto& job : calls) {
    names.insert(job.Name());
    EXPECT_EQ(job.threads_per_instance, 3);
    EXPECT_EQ(job.vox, 10);
    EXPECT_EQ(job.encoder_gof, 16);
    EXPECT_EQ(job.tile.frame_count, 40);
    EXPECT_EQ(job.output_path, encode::JobPlanner::OutputPathFor(config_.encoded_root,
                                                                 job.identity));
  }
  EXPECT_EQ(names.size(), 4u);
}

TEST_F(PipelineRunnerContractTest, MultiplexWritesCombinedTreePerIdentity) {
  config_.multiplex = true;
  ASSERT_TRUE(test::WriteRawFile(dir_.Join("tiles/proj/tile_boundaries.json"),
                                 R"({"1": [{"id": 0, "xmin": 0, "xmax": 1, "ymin": 0,
                                             "ymax": 1, "zmin": 0, "zmax": 1}]})"));
  RunSummary summary = Run();
  ASSERT_EQ(summary.ExitCode(), kExitOk);

  for (int tile = 0; tile < 2; ++tile) {
    for (size_t q = 0; q < 2; ++q) {
      const std::string combined = PipelineRunner::CombinedDirFor(config_, Identity(tile, q));
      EXPECT_TRUE(Exists(JoinPath(combined, "combined/init.bin"))) << combined;
      EXPECT_TRUE(Exists(JoinPath(combined, "combined/segment_0003.bin"))) << combined;
    }
  }

  segment::SegmentIndex index;
  std::string error;
  ASSERT_TRUE(segment::ReadSegmentIndexFile(
      JoinPath(PipelineRunner::SegmentDirFor(config_, Identity(0, 0)), segment::kIndexFileName),
      &index, &error))
      << error;
  EXPECT_EQ(index.tile_id, 0);
  EXPECT_EQ(index.total_frames, 40u);
  ASSERT_EQ(index.tile_bounds.size(), 1u);
  EXPECT_DOUBLE_EQ(index.tile_bounds[0].bounds.x_max, 1.0);
}

TEST_F(PipelineRunnerContractTest, FrameCountOverrideShortensEveryTile) {
  config_.frame_count_override = 32;
  ASSERT_EQ(Run().ExitCode(), kExitOk);
  segment::SegmentIndex index;
  std::string error;
  ASSERT_TRUE(segment::ReadSegmentIndexFile(
      JoinPath(PipelineRunner::SegmentDirFor(config_, Identity(1, 1)), segment::kIndexFileName),
      &index, &error))
      << error;
  EXPECT_EQ(index.total_frames, 32u);
  EXPECT_EQ(index.components.front().segments.size(), 2u);
}

TEST_F(PipelineRunnerContractTest, SkipEncodingUsesContainersOnDisk) {
  config_.skip_encoding = true;
  for (size_t q = 0; q < 2; ++q) {
    test::SyntheticContainerSpec spec;
    spec.gof_count = 3;
    ASSERT_TRUE(test::WriteContainerFile(
        encode::JobPlanner::OutputPathFor(config_.encoded_root, Identity(0, q)), spec));
  }

  RunSummary summary = Run();
  EXPECT_TRUE(launcher_->calls().empty());
  EXPECT_EQ(summary.ExitCode(), kExitDegraded);
  EXPECT_EQ(summary.published, 2u);
  EXPECT_EQ(summary.failed, 2u);
  EXPECT_TRUE(Exists(PipelineRunner::SegmentDirFor(config_, Identity(0, 1))));
  EXPECT_FALSE(Exists(PipelineRunner::SegmentDirFor(config_, Identity(1, 0))));
}

TEST_F(PipelineRunnerContractTest, SkipSegmentationOnlyEncodes) {
  config_.skip_segmentation = true;
  ASSERT_EQ(Run().ExitCode(), kExitOk);
  EXPECT_EQ(launcher_->calls().size(), 4u);
  EXPECT_TRUE(Exists(encode::JobPlanner::OutputPathFor(config_.encoded_root, Identity(1, 1))));
  EXPECT_FALSE(Exists(PipelineRunner::SegmentDirFor(config_, Identity(1, 1))));
}

// =============================================================================
// Fatal configuration
// =============================================================================

TEST_F(PipelineRunnerContractTest, InvalidGofPlanIsFatalBeforeAnyJob) {
  config_.gof_plan = GofPlan{16, 5};
  std::vector<std::string> errors;
  util::Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });
  RunSummary summary = Run();
  util::Logger::SetErrorSink(nullptr);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("[PipelineRunner] FATAL error=CONFIG_INVARIANT_VIOLATION"),
            std::string::npos);
  EXPECT_TRUE(summary.fatal);
  EXPECT_EQ(summary.fatal_error, PipelineError::kConfigInvariantViolation);
  EXPECT_EQ(summary.ExitCode(), kExitFatal);
  EXPECT_TRUE(launcher_->calls().empty());
  EXPECT_FALSE(Exists(config_.logs_dir));
}

TEST_F(PipelineRunnerContractTest, MissingTilesAreFatal) {
  config_.project_name = "other";
  RunSummary summary = Run();
  EXPECT_EQ(summary.ExitCode(), kExitFatal);
  EXPECT_TRUE(launcher_->calls().empty());
}

TEST_F(PipelineRunnerContractTest, MissingVoxIsFatalWhenEncoding) {
  config_.project_name = "plain";
  const std::string tile_dir = dir_.Join("tiles/plain/tile_0");
  ASSERT_TRUE(test::WriteRawFile(JoinPath(tile_dir, "frame_0000.ply"), "ply\n"));
  EXPECT_EQ(Run().ExitCode(), kExitFatal);
  EXPECT_TRUE(launcher_->calls().empty());

  config_.vox = 11;
  Run();
  ASSERT_EQ(launcher_->calls().size(), 2u);
  EXPECT_EQ(launcher_->calls().front().vox, 11);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(PipelineRunnerContractTest, CancelBeforeRunEncodesNothing) {
  PipelineRunner runner(config_, launcher_);
  runner.Cancel();
  RunSummary summary = runner.Run();
  EXPECT_TRUE(summary.cancelled);
  EXPECT_EQ(summary.ExitCode(), kExitCancelled);
  EXPECT_TRUE(launcher_->calls().empty());
  EXPECT_FALSE(Exists(PipelineRunner::SegmentDirFor(config_, Identity(0, 0))));

  index::v1::RunReport report;
  ASSERT_TRUE(ReadReport(&report));
  EXPECT_TRUE(report.cancelled());
  EXPECT_EQ(report.failed_identities_size(), 4);
}

TEST(RunSummaryTest, ExitCodePrecedence) {
  RunSummary summary;
  EXPECT_EQ(summary.ExitCode(), kExitOk);
  summary.degraded = true;
  EXPECT_EQ(summary.ExitCode(), kExitDegraded);
  summary.cancelled = true;
  EXPECT_EQ(summary.ExitCode(), kExitCancelled);
  summary.fatal = true;
  EXPECT_EQ(summary.ExitCode(), kExitFatal);
}

}  // namespace
}  // namespace v3cdash::pipeline
