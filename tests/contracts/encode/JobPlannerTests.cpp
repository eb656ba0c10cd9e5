// Repository: V3CDash
// Component: Job Planner Tests
// Copyright (c) 2025 V3CDash Contributors

#include <gtest/gtest.h>

#include "v3cdash/encode/JobPlanner.hpp"

namespace v3cdash::encode {
namespace {

Tile MakeTile(int32_t id) {
  Tile tile;
  tile.id = id;
  tile.directory = "/tiles/proj/tile_" + std::to_string(id);
  tile.frame_pattern = "loot_vox10_%04d.ply";
  tile.start_frame = 1000;
  tile.frame_count = 300;
  return tile;
}

PipelineConfig MakeConfig() {
  PipelineConfig config;
  config.project_name = "proj";
  config.encoded_root = "/out/encoded";
  config.gof_plan = GofPlan{32, 16};
  config.triplets = {QualityTriplet{24, 32, 43}, QualityTriplet{28, 36, 45},
                     QualityTriplet{32, 40, 47}};
  return config;
}

TEST(JobPlannerTest, TileMajorQualityMinor) {
  ThreadBudget budget{4, 2};
  auto jobs = JobPlanner::Plan({MakeTile(0), MakeTile(1)}, MakeConfig(), budget, 10, "/logs");
  ASSERT_EQ(jobs.size(), 6u);
  EXPECT_EQ(jobs[0].Name(), "proj_tile_0_occ24_geo32_attr43");
  EXPECT_EQ(jobs[2].Name(), "proj_tile_0_occ32_geo40_attr47");
  EXPECT_EQ(jobs[3].Name(), "proj_tile_1_occ24_geo32_attr43");
  for (const auto& job : jobs) {
    EXPECT_EQ(job.state, EncodeJobState::kPending);
    EXPECT_EQ(job.threads_per_instance, 2);
    EXPECT_EQ(job.encoder_gof, 16);
    EXPECT_EQ(job.vox, 10);
    EXPECT_EQ(job.tile.start_frame, 1000);
    EXPECT_EQ(job.tile.frame_count, 300);
    EXPECT_EQ(job.log_path, "/logs/" + job.Name() + ".log");
  }
}

TEST(JobPlannerTest, OutputPathsAreDistinctPerIdentity) {
  auto jobs = JobPlanner::Plan({MakeTile(3)}, MakeConfig(), ThreadBudget{}, 11, "/logs");
  ASSERT_EQ(jobs.size(), 3u);
  EXPECT_EQ(jobs[1].output_path, "/out/encoded/proj/proj_tile_3_occ28_geo36_attr45.bin");
  EXPECT_NE(jobs[0].output_path, jobs[1].output_path);
  EXPECT_NE(jobs[1].output_path, jobs[2].output_path);
}

TEST(JobPlannerTest, FrameOverridesReplaceEveryTileRange) {
  PipelineConfig config = MakeConfig();
  config.start_frame_override = 1051;
  config.frame_count_override = 64;
  auto jobs = JobPlanner::Plan({MakeTile(0), MakeTile(1)}, config, ThreadBudget{}, 10, "/logs");
  for (const auto& job : jobs) {
    EXPECT_EQ(job.tile.start_frame, 1051);
    EXPECT_EQ(job.tile.frame_count, 64);
    EXPECT_EQ(job.tile.EndFrame(), 1115);
  }
}

TEST(JobPlannerTest, NoTilesPlansNothing) {
  EXPECT_TRUE(JobPlanner::Plan({}, MakeConfig(), ThreadBudget{}, 10, "/logs").empty());
}

}  // namespace
}  // namespace v3cdash::encode
