// Repository: V3CDash
// Component: Pipeline Configuration
// Purpose: Run configuration and its up-front validation. A config that
//          fails validation is rejected before any encode job is scheduled.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_CORE_PIPELINE_CONFIG_HPP_
#define V3CDASH_CORE_PIPELINE_CONFIG_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash {

// Argument templates for the V-PCC test-model encoder (PccAppEncoder).
std::vector<std::string> DefaultEncoderArgs();

// External encoder command run once per job.
struct EncoderCommandConfig {
  std::string program = "PccAppEncoder";
  // Placeholders: {tile_dir} {frame_pattern} {start_frame} {frame_count}
  // {output} {occ} {geo} {attr} {threads} {gof} {vox} {tile_id} {identity}
  std::vector<std::string> args = DefaultEncoderArgs();
  std::vector<std::string> extra_args;  // appended after args, same placeholders
  std::string working_dir;
  std::chrono::milliseconds grace_period{5000};
};

// POD struct - immutable once the run starts.
struct PipelineConfig {
  std::string project_name = "default_project";

  // Tiles are read from <tiles_root>/<project>/tile_<id>/.
  std::string tiles_root = "output/tiles";
  // Containers are written to <encoded_root>/<project>/<identity>.bin.
  std::string encoded_root = "output/encoded";
  // Segment trees are written to <segmented_root>/<project>/<identity>/.
  std::string segmented_root = "output/v3c";
  // Multiplexed trees are written to <combined_root>/<project>/<identity>/.
  std::string combined_root = "output/v3c_combined";
  // Run logs go to <logs_dir>/<project>/<timestamp>/.
  std::string logs_dir = "output/logs";

  GofPlan gof_plan;
  double frame_rate = 30.0;

  int parallelism = 1;
  std::optional<int> threads_per_instance;

  std::vector<QualityTriplet> triplets = {QualityTriplet{24, 32, 43}};

  bool split_components = true;
  bool multiplex = false;
  bool skip_encoding = false;
  bool skip_segmentation = false;

  std::optional<int64_t> frame_count_override;
  std::optional<int64_t> start_frame_override;
  std::optional<int> vox;

  EncoderCommandConfig encoder;
};

// =============================================================================
// Config Validator
// Fail fast on the first violated invariant.
// =============================================================================

class ConfigValidator {
 public:
  struct ValidationResult {
    bool valid;
    PipelineError error;
    std::string detail;

    static ValidationResult Success() { return {true, PipelineError::kNone, ""}; }
    static ValidationResult Failure(const std::string& detail) {
      return {false, PipelineError::kConfigInvariantViolation, detail};
    }
  };

  static ValidationResult Validate(const PipelineConfig& config);

  // segment_size > 0, encoder_gof > 0, segment_size % encoder_gof == 0
  static ValidationResult ValidateGofPlan(const GofPlan& plan);

  // Resolves the thread budget, logging a warning when threads_per_instance
  // is clamped to parallelism. Precondition: Validate() succeeded.
  static ThreadBudget ResolveBudget(const PipelineConfig& config);
};

}  // namespace v3cdash

#endif  // V3CDASH_CORE_PIPELINE_CONFIG_HPP_
