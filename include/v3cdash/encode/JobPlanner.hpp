// Repository: V3CDash
// Component: Job Planner
// Purpose: Cartesian product of tiles and quality triplets, with
//          deterministic output and log paths per bitstream identity.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_JOB_PLANNER_HPP_
#define V3CDASH_ENCODE_JOB_PLANNER_HPP_

#include <string>
#include <vector>

#include "v3cdash/core/PipelineConfig.hpp"
#include "v3cdash/core/PipelineTypes.hpp"
#include "v3cdash/encode/EncodeJob.hpp"

namespace v3cdash::encode {

class JobPlanner {
 public:
  // Tile-major, quality-minor. Frame overrides from config replace each
  // tile's range.
  static std::vector<EncodeJob> Plan(const std::vector<Tile>& tiles,
                                     const PipelineConfig& config,
                                     const ThreadBudget& budget, int vox,
                                     const std::string& encode_log_dir);

  // <encoded_root>/<project>/<identity>.bin
  static std::string OutputPathFor(const std::string& encoded_root,
                                   const BitstreamIdentity& identity);
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_JOB_PLANNER_HPP_
