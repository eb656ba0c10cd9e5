// Repository: V3CDash
// Component: Command Encoder Launcher Tests
// Purpose: Argument expansion, and that only a parsable container ever
//          appears at the final output path.
// Copyright (c) 2025 V3CDash Contributors

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "SyntheticContainer.hpp"
#include "TempDir.hpp"
#include "v3cdash/encode/CommandEncoderLauncher.hpp"

namespace v3cdash::encode {
namespace {

using test::Exists;
using test::ReadBytes;
using test::TempDir;

EncodeJob MakeJob(const TempDir& dir) {
  EncodeJob job;
  job.identity.project = "proj";
  job.identity.tile_id = 0;
  job.identity.quality = QualityTriplet{24, 32, 43};
  job.tile.id = 0;
  job.tile.directory = dir.Join("tiles/proj/tile_0");
  job.tile.frame_pattern = "longdress_vox10_%04d.ply";
  job.tile.start_frame = 1051;
  job.tile.frame_count = 32;
  job.threads_per_instance = 2;
  job.encoder_gof = 16;
  job.vox = 10;
  job.output_path = dir.Join("encoded/proj/" + job.Name() + ".bin");
  job.log_path = dir.Join("logs/encoding/" + job.Name() + ".log");
  return job;
}

// /bin/sh -c <script> sh <output>: the script sees the output path as $1.
EncoderCommandConfig ShellEncoder(const std::string& script) {
  EncoderCommandConfig config;
  config.program = "/bin/sh";
  config.args = {"-c", script, "sh", "{output}"};
  config.grace_period = std::chrono::milliseconds(500);
  return config;
}

bool Contains(const std::vector<std::string>& args, const std::string& value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

TEST(CommandEncoderLauncherTest, DefaultArgumentsCarryJobParameters) {
  TempDir dir("launcher_args");
  const EncodeJob job = MakeJob(dir);
  CommandEncoderLauncher launcher(EncoderCommandConfig{});
  auto args = launcher.BuildArguments(job, "/out/c.bin.part");

  EXPECT_TRUE(Contains(args, "--uncompressedDataFolder=" + job.tile.directory + "/"));
  EXPECT_TRUE(Contains(args, "--uncompressedDataPath=longdress_vox10_%04d.ply"));
  EXPECT_TRUE(Contains(args, "--startFrameNumber=1051"));
  EXPECT_TRUE(Contains(args, "--frameCount=32"));
  EXPECT_TRUE(Contains(args, "--compressedStreamPath=/out/c.bin.part"));
  EXPECT_TRUE(Contains(args, "--nbThread=2"));
  EXPECT_TRUE(Contains(args, "--groupOfFramesSize=16"));
  EXPECT_TRUE(Contains(args, "--occupancyMapQP=24"));
  EXPECT_TRUE(Contains(args, "--geometryQP=32"));
  EXPECT_TRUE(Contains(args, "--attributeQP=43"));
  EXPECT_TRUE(Contains(args, "--geometry3dCoordinatesBitdepth=10"));
}

TEST(CommandEncoderLauncherTest, ExtraArgumentsAreAppendedAndExpanded) {
  TempDir dir("launcher_extra");
  EncoderCommandConfig config;
  config.args = {"--config={identity}.cfg"};
  config.extra_args = {"--tile={tile_id}", "{unknown}"};
  CommandEncoderLauncher launcher(config);
  auto args = launcher.BuildArguments(MakeJob(dir), "/out/c.bin");
  ASSERT_EQ(args.size(), 3u);
  EXPECT_EQ(args[0], "--config=proj_tile_0_occ24_geo32_attr43.cfg");
  EXPECT_EQ(args[1], "--tile=0");
  EXPECT_EQ(args[2], "{unknown}");
}

TEST(CommandEncoderLauncherTest, ExpandPlaceholdersHandlesUnterminatedBrace) {
  EXPECT_EQ(ExpandPlaceholders("a{b", {{"b", "x"}}), "a{b");
  EXPECT_EQ(ExpandPlaceholders("{b}{b}", {{"b", "x"}}), "xx");
}

TEST(CommandEncoderLauncherTest, ValidContainerIsPublished) {
  TempDir dir("launcher_ok");
  const std::string fixture = dir.Join("fixture.bin");
  ASSERT_TRUE(test::WriteContainerFile(fixture, test::SyntheticContainerSpec{}));

  EncodeJob job = MakeJob(dir);
  CommandEncoderLauncher launcher(ShellEncoder("echo encoding; cp '" + fixture + "' \"$1\""));
  std::atomic<bool> cancel{false};
  auto outcome = launcher.Encode(job, cancel);

  ASSERT_TRUE(outcome.ok) << outcome.reason;
  EXPECT_EQ(outcome.output_path, job.output_path);
  EXPECT_EQ(ReadBytes(job.output_path), ReadBytes(fixture));
  EXPECT_FALSE(Exists(CommandEncoderLauncher::PartialPathFor(job.output_path)));

  const std::string log = test::ReadText(job.log_path);
  EXPECT_NE(log.find("# encode " + job.Name()), std::string::npos) << log;
  EXPECT_NE(log.find("encoding"), std::string::npos) << log;
}

TEST(CommandEncoderLauncherTest, CorruptContainerIsNeverPublished) {
  TempDir dir("launcher_corrupt");
  EncodeJob job = MakeJob(dir);
  CommandEncoderLauncher launcher(ShellEncoder("printf 'garbage' > \"$1\""));
  std::atomic<bool> cancel{false};
  auto outcome = launcher.Encode(job, cancel);

  EXPECT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.error, PipelineError::kEncodeJobFailure);
  EXPECT_NE(outcome.reason.find("corrupt"), std::string::npos) << outcome.reason;
  EXPECT_FALSE(Exists(job.output_path));
  EXPECT_FALSE(Exists(CommandEncoderLauncher::PartialPathFor(job.output_path)));
}

TEST(CommandEncoderLauncherTest, EmptyContainerFails) {
  TempDir dir("launcher_empty");
  EncodeJob job = MakeJob(dir);
  CommandEncoderLauncher launcher(ShellEncoder(": > \"$1\""));
  std::atomic<bool> cancel{false};
  auto outcome = launcher.Encode(job, cancel);
  EXPECT_FALSE(outcome.ok);
  EXPECT_NE(outcome.reason.find("empty"), std::string::npos) << outcome.reason;
}

TEST(CommandEncoderLauncherTest, NonZeroExitRemovesStaleOutput) {
  TempDir dir("launcher_exit");
  EncodeJob job = MakeJob(dir);
  ASSERT_TRUE(test::WriteContainerFile(job.output_path, test::SyntheticContainerSpec{}));

  CommandEncoderLauncher launcher(ShellEncoder("printf 'partial' > \"$1\"; exit 5"));
  std::atomic<bool> cancel{false};
  auto outcome = launcher.Encode(job, cancel);

  EXPECT_FALSE(outcome.ok);
  EXPECT_NE(outcome.reason.find("exit code 5"), std::string::npos) << outcome.reason;
  EXPECT_FALSE(Exists(job.output_path));
  EXPECT_FALSE(Exists(CommandEncoderLauncher::PartialPathFor(job.output_path)));
}

TEST(CommandEncoderLauncherTest, CancelledEncodeLeavesNothing) {
  TempDir dir("launcher_cancel");
  EncodeJob job = MakeJob(dir);
  CommandEncoderLauncher launcher(ShellEncoder("printf 'x' > \"$1\"; sleep 30"));
  std::atomic<bool> cancel{false};
  std::thread canceller([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancel.store(true);
  });
  auto outcome = launcher.Encode(job, cancel);
  canceller.join();

  EXPECT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.error, PipelineError::kCancelled);
  EXPECT_FALSE(Exists(CommandEncoderLauncher::PartialPathFor(job.output_path)));
  EXPECT_FALSE(Exists(job.output_path));
}

}  // namespace
}  // namespace v3cdash::encode
