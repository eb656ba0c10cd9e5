// Repository: V3CDash
// Component: Job Planner Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/encode/JobPlanner.hpp"

#include "v3cdash/segment/SegmentLayout.hpp"

namespace v3cdash::encode {

std::vector<EncodeJob> JobPlanner::Plan(const std::vector<Tile>& tiles,
                                        const PipelineConfig& config,
                                        const ThreadBudget& budget, int vox,
                                        const std::string& encode_log_dir) {
  std::vector<EncodeJob> jobs;
  jobs.reserve(tiles.size() * config.triplets.size());
  for (const auto& tile : tiles) {
    for (const auto& quality : config.triplets) {
      EncodeJob job;
      job.identity.project = config.project_name;
      job.identity.tile_id = tile.id;
      job.identity.quality = quality;
      job.tile = tile;
      if (config.start_frame_override.has_value()) {
        job.tile.start_frame = *config.start_frame_override;
      }
      if (config.frame_count_override.has_value()) {
        job.tile.frame_count = *config.frame_count_override;
      }
      job.threads_per_instance = budget.threads_per_instance;
      job.encoder_gof = config.gof_plan.encoder_gof;
      job.vox = vox;
      job.output_path = OutputPathFor(config.encoded_root, job.identity);
      job.log_path = segment::JoinPath(encode_log_dir, job.Name() + ".log");
      jobs.push_back(std::move(job));
    }
  }
  return jobs;
}

std::string JobPlanner::OutputPathFor(const std::string& encoded_root,
                                      const BitstreamIdentity& identity) {
  return segment::JoinPath(segment::JoinPath(encoded_root, identity.project),
                           identity.Name() + ".bin");
}

}  // namespace v3cdash::encode
