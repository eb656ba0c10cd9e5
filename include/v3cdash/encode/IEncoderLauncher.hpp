// Repository: V3CDash
// Component: Encoder Launcher Interface
// Purpose: Seam between the scheduler and whatever produces a container for
//          one job. Production uses CommandEncoderLauncher; tests inject fakes.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_I_ENCODER_LAUNCHER_HPP_
#define V3CDASH_ENCODE_I_ENCODER_LAUNCHER_HPP_

#include <atomic>

#include "v3cdash/encode/EncodeJob.hpp"

namespace v3cdash::encode {

class IEncoderLauncher {
 public:
  virtual ~IEncoderLauncher() = default;

  // Produces job.output_path or reports why not. Must return promptly once
  // cancel is set, and must not leave a partial file at job.output_path.
  // Called concurrently from scheduler workers with distinct jobs.
  virtual EncodeOutcome Encode(const EncodeJob& job, const std::atomic<bool>& cancel) = 0;
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_I_ENCODER_LAUNCHER_HPP_
