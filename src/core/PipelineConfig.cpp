// Repository: V3CDash
// Component: Pipeline Configuration Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/core/PipelineConfig.hpp"

#include <sstream>

#include "v3cdash/util/Logger.hpp"

namespace v3cdash {

using util::Logger;

std::vector<std::string> DefaultEncoderArgs() {
  return {
      "--uncompressedDataFolder={tile_dir}/",
      "--uncompressedDataPath={frame_pattern}",
      "--startFrameNumber={start_frame}",
      "--frameCount={frame_count}",
      "--compressedStreamPath={output}",
      "--nbThread={threads}",
      "--groupOfFramesSize={gof}",
      "--occupancyMapQP={occ}",
      "--geometryQP={geo}",
      "--attributeQP={attr}",
      "--geometry3dCoordinatesBitdepth={vox}",
      "--computeMetrics=0",
      "--computeChecksum=0",
      "--keepIntermediateFiles=0",
  };
}

ConfigValidator::ValidationResult ConfigValidator::ValidateGofPlan(const GofPlan& plan) {
  if (plan.segment_size <= 0) {
    return ValidationResult::Failure("segment-size must be positive");
  }
  if (plan.encoder_gof <= 0) {
    return ValidationResult::Failure("encoder-gof must be positive");
  }
  if (plan.segment_size % plan.encoder_gof != 0) {
    std::ostringstream detail;
    detail << "segment-size (" << plan.segment_size
           << ") must be a multiple of encoder-gof (" << plan.encoder_gof << ")";
    return ValidationResult::Failure(detail.str());
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::Validate(const PipelineConfig& config) {
  if (config.project_name.empty()) {
    return ValidationResult::Failure("project name must not be empty");
  }
  if (config.project_name.find('/') != std::string::npos) {
    return ValidationResult::Failure("project name must not contain '/'");
  }

  auto result = ValidateGofPlan(config.gof_plan);
  if (!result.valid) return result;

  if (!(config.frame_rate > 0.0)) {
    return ValidationResult::Failure("frame-rate must be positive");
  }
  if (config.parallelism <= 0) {
    return ValidationResult::Failure("parallelism must be positive");
  }
  if (config.threads_per_instance.has_value() && *config.threads_per_instance <= 0) {
    return ValidationResult::Failure("threads-per-instance must be positive");
  }

  if (config.triplets.empty()) {
    return ValidationResult::Failure("qp triplets cannot be empty");
  }
  for (const auto& q : config.triplets) {
    if (q.occ < 0 || q.geo < 0 || q.attr < 0) {
      std::ostringstream detail;
      detail << "invalid qp triplet (" << q.occ << ":" << q.geo << ":" << q.attr
             << "); QP values must be non-negative";
      return ValidationResult::Failure(detail.str());
    }
  }
  for (size_t i = 0; i < config.triplets.size(); ++i) {
    for (size_t j = i + 1; j < config.triplets.size(); ++j) {
      if (config.triplets[i] == config.triplets[j]) {
        return ValidationResult::Failure("duplicate qp triplet " +
                                         FormatQualityTriplet(config.triplets[i]));
      }
    }
  }

  if (config.frame_count_override.has_value() && *config.frame_count_override <= 0) {
    return ValidationResult::Failure("frame-count must be positive when provided");
  }
  if (config.start_frame_override.has_value() && *config.start_frame_override < 0) {
    return ValidationResult::Failure("start-frame-number must be >= 0 when provided");
  }
  if (config.vox.has_value() && *config.vox <= 0) {
    return ValidationResult::Failure("vox must be positive when provided");
  }
  if (!config.skip_encoding && config.encoder.program.empty()) {
    return ValidationResult::Failure("encoder program must be set when encoding is enabled");
  }

  return ValidationResult::Success();
}

ThreadBudget ConfigValidator::ResolveBudget(const PipelineConfig& config) {
  ThreadBudget budget =
      ThreadBudget::Resolve(config.parallelism, config.threads_per_instance);
  if (config.threads_per_instance.has_value() &&
      *config.threads_per_instance > budget.threads_per_instance) {
    std::ostringstream oss;
    oss << "[ConfigValidator] THREADS_CLAMPED requested="
        << *config.threads_per_instance << " parallelism=" << config.parallelism
        << " threads_per_instance=" << budget.threads_per_instance;
    Logger::Warn(oss.str());
  }
  return budget;
}

}  // namespace v3cdash
