// Repository: V3CDash
// Component: Pipeline Runner
// Purpose: Orchestrates one run: validate, plan, encode (bounded pool),
//          segment succeeded identities, optionally multiplex, report.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_PIPELINE_PIPELINE_RUNNER_HPP_
#define V3CDASH_PIPELINE_PIPELINE_RUNNER_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "v3cdash/core/PipelineConfig.hpp"
#include "v3cdash/encode/EncodeScheduler.hpp"
#include "v3cdash/encode/IEncoderLauncher.hpp"

namespace v3cdash::pipeline {

// CLI exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitDegraded = 1;
inline constexpr int kExitFatal = 2;
inline constexpr int kExitCancelled = 130;

struct RunSummary {
  bool fatal = false;
  PipelineError fatal_error = PipelineError::kNone;
  std::string fatal_detail;
  bool cancelled = false;
  bool degraded = false;
  size_t identities = 0;
  size_t published = 0;
  size_t failed = 0;
  std::string run_log_dir;
  std::string report_path;

  int ExitCode() const;
};

class PipelineRunner {
 public:
  // launcher == nullptr runs config.encoder through CommandEncoderLauncher.
  explicit PipelineRunner(PipelineConfig config,
                          std::shared_ptr<encode::IEncoderLauncher> launcher = nullptr);

  PipelineRunner(const PipelineRunner&) = delete;
  PipelineRunner& operator=(const PipelineRunner&) = delete;

  // Not re-entrant.
  RunSummary Run();

  // Thread-safe. Stops dispatch, cancels in-flight encodes and skips the
  // segmentation and multiplex stages.
  void Cancel();
  bool IsCancelled() const { return cancel_.load(std::memory_order_acquire); }

  // <segmented_root>/<project>/<identity>
  static std::string SegmentDirFor(const PipelineConfig& config,
                                   const BitstreamIdentity& identity);
  // <combined_root>/<project>/<identity>
  static std::string CombinedDirFor(const PipelineConfig& config,
                                    const BitstreamIdentity& identity);
  // <segmented_root>/<project>/run_report.json
  static std::string ReportPathFor(const PipelineConfig& config);

 private:
  PipelineConfig config_;
  std::shared_ptr<encode::IEncoderLauncher> launcher_;

  std::atomic<bool> cancel_{false};
  std::mutex scheduler_mutex_;
  encode::EncodeScheduler* active_scheduler_ = nullptr;  // Guarded by scheduler_mutex_
};

}  // namespace v3cdash::pipeline

#endif  // V3CDASH_PIPELINE_PIPELINE_RUNNER_HPP_
