// Repository: V3CDash
// Component: Encode Job
// Purpose: One (tile, quality triplet) encode and its scheduler-owned state.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_ENCODE_JOB_HPP_
#define V3CDASH_ENCODE_ENCODE_JOB_HPP_

#include <string>

#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash::encode {

// Pending -> Running -> Succeeded | Failed. Jobs are never reused.
enum class EncodeJobState {
  kPending,
  kRunning,
  kSucceeded,
  kFailed,
};

inline bool IsTerminal(EncodeJobState state) {
  return state == EncodeJobState::kSucceeded || state == EncodeJobState::kFailed;
}

// Result of one external encode. Never thrown across the scheduler boundary.
struct EncodeOutcome {
  bool ok = false;
  PipelineError error = PipelineError::kNone;
  std::string output_path;  // set when ok
  std::string reason;       // set when !ok

  static EncodeOutcome Succeeded(const std::string& path) {
    return {true, PipelineError::kNone, path, ""};
  }
  static EncodeOutcome Failed(const std::string& reason,
                              PipelineError error = PipelineError::kEncodeJobFailure) {
    return {false, error, "", reason};
  }
  static EncodeOutcome Cancelled(const std::string& reason) {
    return Failed(reason, PipelineError::kCancelled);
  }
};

struct EncodeJob {
  BitstreamIdentity identity;
  Tile tile;                  // frame range already reflects run overrides
  int threads_per_instance = 1;
  int encoder_gof = 16;
  int vox = 10;               // geometry 3D coordinate bit depth
  std::string output_path;    // exclusive to this job
  std::string log_path;       // encoder stdout/stderr

  EncodeJobState state = EncodeJobState::kPending;
  EncodeOutcome outcome;

  std::string Name() const { return identity.Name(); }
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_ENCODE_JOB_HPP_
