// Repository: V3CDash
// Component: Pipeline Runner Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/pipeline/PipelineRunner.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <filesystem>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include "v3cdash/encode/CommandEncoderLauncher.hpp"
#include "v3cdash/encode/JobPlanner.hpp"
#include "v3cdash/mux/Multiplexer.hpp"
#include "v3cdash/pipeline/RunJournal.hpp"
#include "v3cdash/pipeline/TileCatalog.hpp"
#include "v3cdash/segment/BitstreamSegmenter.hpp"
#include "v3cdash/segment/SegmentLayout.hpp"
#include "v3cdash/util/Logger.hpp"

namespace fs = std::filesystem;

namespace v3cdash::pipeline {

using encode::EncodeJob;
using encode::EncodeJobState;
using util::Logger;

int RunSummary::ExitCode() const {
  if (fatal) return kExitFatal;
  if (cancelled) return kExitCancelled;
  if (degraded) return kExitDegraded;
  return kExitOk;
}

namespace {

std::string RunTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &local);
  return buf;
}

// Runs task(i) for i in [0, count) on up to `workers` threads. Stops handing
// out new indices once cancel is set; returns the indices never started.
std::vector<size_t> RunParallel(size_t count, int workers, const std::atomic<bool>& cancel,
                                const std::function<void(size_t)>& task) {
  std::mutex mutex;
  size_t next = 0;
  auto worker = [&]() {
    while (true) {
      size_t index = 0;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (next >= count || cancel.load(std::memory_order_acquire)) return;
        index = next++;
      }
      task(index);
    }
  };

  const int n = static_cast<int>(std::min<size_t>(static_cast<size_t>(std::max(1, workers)),
                                                  count));
  std::vector<std::thread> pool;
  pool.reserve(n);
  for (int i = 0; i < n; ++i) pool.emplace_back(worker);
  for (auto& t : pool) t.join();

  std::vector<size_t> skipped;
  for (size_t i = next; i < count; ++i) skipped.push_back(i);
  return skipped;
}

void RemoveIdentityTree(const std::string& path) {
  segment::StagedDirectory(path).Abandon();
}

IdentityOutcome MakeOutcome(const BitstreamIdentity& identity, PipelineStage stage, bool ok,
                            PipelineError error, const std::string& detail) {
  IdentityOutcome o;
  o.identity = identity;
  o.stage = stage;
  o.ok = ok;
  o.error = error;
  o.detail = detail;
  return o;
}

RunSummary FatalSummary(PipelineError error, const std::string& detail) {
  Logger::Error("[PipelineRunner] FATAL error=" + std::string(PipelineErrorToString(error)) +
                " detail=" + detail);
  RunSummary summary;
  summary.fatal = true;
  summary.fatal_error = error;
  summary.fatal_detail = detail;
  return summary;
}

}  // namespace

PipelineRunner::PipelineRunner(PipelineConfig config,
                               std::shared_ptr<encode::IEncoderLauncher> launcher)
    : config_(std::move(config)), launcher_(std::move(launcher)) {
  if (!launcher_) {
    launcher_ = std::make_shared<encode::CommandEncoderLauncher>(config_.encoder);
  }
}

std::string PipelineRunner::SegmentDirFor(const PipelineConfig& config,
                                          const BitstreamIdentity& identity) {
  return segment::JoinPath(segment::JoinPath(config.segmented_root, identity.project),
                           identity.Name());
}

std::string PipelineRunner::CombinedDirFor(const PipelineConfig& config,
                                           const BitstreamIdentity& identity) {
  return segment::JoinPath(segment::JoinPath(config.combined_root, identity.project),
                           identity.Name());
}

std::string PipelineRunner::ReportPathFor(const PipelineConfig& config) {
  return segment::JoinPath(segment::JoinPath(config.segmented_root, config.project_name),
                           kRunReportFileName);
}

void PipelineRunner::Cancel() {
  cancel_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(scheduler_mutex_);
  if (active_scheduler_ != nullptr) active_scheduler_->Cancel();
}

RunSummary PipelineRunner::Run() {
  // ===========================================================================
  // Configuration
  // ===========================================================================
  auto validation = ConfigValidator::Validate(config_);
  if (!validation.valid) {
    return FatalSummary(validation.error, validation.detail);
  }
  const ThreadBudget budget = ConfigValidator::ResolveBudget(config_);

  const std::string run_dir = segment::JoinPath(
      segment::JoinPath(config_.logs_dir, config_.project_name), RunTimestamp());
  const std::string encode_log_dir = segment::JoinPath(run_dir, "encoding");
  std::string error;
  if (!segment::MakeDirs(encode_log_dir, &error)) {
    return FatalSummary(PipelineError::kConfigInvariantViolation, error);
  }
  if (!Logger::SetLogFile(segment::JoinPath(run_dir, "run.log"))) {
    Logger::Warn("[PipelineRunner] RUN_LOG_UNAVAILABLE dir=" + run_dir);
  }

  RunSummary summary = [&]() -> RunSummary {
    {
      std::ostringstream oss;
      oss << "[PipelineRunner] RUN_START project=" << config_.project_name
          << " segment_size=" << config_.gof_plan.segment_size
          << " encoder_gof=" << config_.gof_plan.encoder_gof
          << " gofs_per_segment=" << config_.gof_plan.GofsPerSegment()
          << " parallelism=" << budget.parallelism
          << " threads_per_instance=" << budget.threads_per_instance
          << " max_concurrent_encodes=" << budget.MaxConcurrentEncodes()
          << " triplets=" << config_.triplets.size()
          << " split=" << (config_.split_components ? "true" : "false")
          << " multiplex=" << (config_.multiplex ? "true" : "false");
      Logger::Info(oss.str());
    }

    std::vector<Tile> tiles;
    const std::string tiles_dir = segment::JoinPath(config_.tiles_root, config_.project_name);
    auto catalog = TileCatalog::Discover(tiles_dir, &tiles);
    if (!catalog.ok) {
      return FatalSummary(PipelineError::kConfigInvariantViolation, catalog.error);
    }

    int vox = 0;
    if (config_.vox.has_value()) {
      vox = *config_.vox;
    } else if (auto inferred = TileCatalog::InferVox(tiles.front().frame_pattern)) {
      vox = *inferred;
    } else if (!config_.skip_encoding) {
      return FatalSummary(PipelineError::kConfigInvariantViolation,
                          "vox bit depth could not be inferred from '" +
                              tiles.front().frame_pattern + "'; provide --vox");
    }
    Logger::Info("[PipelineRunner] VOX_RESOLVED vox=" + std::to_string(vox));

    std::vector<EncodeJob> jobs =
        encode::JobPlanner::Plan(tiles, config_, budget, vox, encode_log_dir);

    std::unique_ptr<RunJournal> journal;
    try {
      journal = std::make_unique<RunJournal>(run_dir, config_.project_name, config_.gof_plan,
                                             budget);
    } catch (const std::runtime_error& e) {
      return FatalSummary(PipelineError::kConfigInvariantViolation, e.what());
    }

    // =========================================================================
    // Encode
    // =========================================================================
    auto record_encode = [&](const EncodeJob& job) {
      journal->Record(MakeOutcome(job.identity, PipelineStage::kEncode, job.outcome.ok,
                                  job.outcome.error, job.outcome.reason));
      if (!job.outcome.ok) {
        RemoveIdentityTree(SegmentDirFor(config_, job.identity));
        RemoveIdentityTree(CombinedDirFor(config_, job.identity));
      }
    };

    if (config_.skip_encoding) {
      Logger::Info("[PipelineRunner] STAGE_SKIPPED stage=ENCODE");
      for (auto& job : jobs) {
        std::error_code ec;
        if (fs::is_regular_file(job.output_path, ec)) {
          job.state = EncodeJobState::kSucceeded;
          job.outcome = encode::EncodeOutcome::Succeeded(job.output_path);
        } else {
          job.state = EncodeJobState::kFailed;
          job.outcome = encode::EncodeOutcome::Failed("container missing: " + job.output_path);
        }
        record_encode(job);
      }
    } else {
      encode::EncodeScheduler scheduler(*launcher_, budget.MaxConcurrentEncodes());
      scheduler.SetJobFinishedCallback(record_encode);
      {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        active_scheduler_ = &scheduler;
        if (IsCancelled()) scheduler.Cancel();
      }
      try {
        jobs = scheduler.Run(std::move(jobs));
      } catch (const std::invalid_argument& e) {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        active_scheduler_ = nullptr;
        return FatalSummary(PipelineError::kConfigInvariantViolation, e.what());
      }
      std::lock_guard<std::mutex> lock(scheduler_mutex_);
      active_scheduler_ = nullptr;
    }

    std::vector<const EncodeJob*> encoded;
    for (const auto& job : jobs) {
      if (job.state == EncodeJobState::kSucceeded) encoded.push_back(&job);
    }

    // =========================================================================
    // Segment
    // =========================================================================
    std::vector<const EncodeJob*> segmented_split;
    std::mutex segmented_mutex;
    if (config_.skip_segmentation) {
      Logger::Info("[PipelineRunner] STAGE_SKIPPED stage=SEGMENT");
    } else if (IsCancelled()) {
      Logger::Warn("[PipelineRunner] STAGE_SKIPPED stage=SEGMENT reason=cancelled");
      for (const EncodeJob* job : encoded) {
        RemoveIdentityTree(SegmentDirFor(config_, job->identity));
        journal->Record(MakeOutcome(job->identity, PipelineStage::kSegment, false,
                                    PipelineError::kCancelled, "segmentation skipped"));
      }
    } else {
      auto segment_one = [&](size_t i) {
        const EncodeJob& job = *encoded[i];
        segment::SegmentRequest request;
        request.container_path = job.output_path;
        request.output_dir = SegmentDirFor(config_, job.identity);
        request.project = config_.project_name;
        request.identity = job.Name();
        request.tile_id = job.identity.tile_id;
        request.quality = job.identity.quality;
        request.gof_plan = config_.gof_plan;
        request.frame_rate = config_.frame_rate;
        request.expected_frames = job.tile.frame_count;
        request.split_components = config_.split_components;
        request.tile_bounds = job.tile.spatial_bounds;

        segment::SegmentationResult result =
            segment::SegmentationResult::Failure("segmentation did not run");
        try {
          result = segment::BitstreamSegmenter::Segment(request);
        } catch (const std::exception& e) {
          RemoveIdentityTree(request.output_dir);
          result = segment::SegmentationResult::Failure(std::string("segmenter error: ") +
                                                        e.what());
        }
        if (!result.ok) RemoveIdentityTree(CombinedDirFor(config_, job.identity));
        journal->Record(MakeOutcome(job.identity, PipelineStage::kSegment, result.ok,
                                    result.error, result.detail));
        if (result.ok && result.index.layout == ContainerLayout::kSplit) {
          std::lock_guard<std::mutex> lock(segmented_mutex);
          segmented_split.push_back(&job);
        }
      };
      auto skipped = RunParallel(encoded.size(), budget.parallelism, cancel_, segment_one);
      for (size_t i : skipped) {
        RemoveIdentityTree(SegmentDirFor(config_, encoded[i]->identity));
        journal->Record(MakeOutcome(encoded[i]->identity, PipelineStage::kSegment, false,
                                    PipelineError::kCancelled, "segmentation skipped"));
      }
    }

    // =========================================================================
    // Multiplex
    // =========================================================================
    if (config_.multiplex && !config_.skip_segmentation) {
      std::sort(segmented_split.begin(), segmented_split.end(),
                [](const EncodeJob* a, const EncodeJob* b) { return a->Name() < b->Name(); });
      auto multiplex_one = [&](size_t i) {
        const EncodeJob& job = *segmented_split[i];
        mux::MultiplexRequest request;
        request.input_root = SegmentDirFor(config_, job.identity);
        request.output_root = CombinedDirFor(config_, job.identity);
        mux::MultiplexResult result = mux::MultiplexResult::Failure("multiplex did not run");
        try {
          result = mux::Multiplexer::Multiplex(request);
        } catch (const std::exception& e) {
          RemoveIdentityTree(request.output_root);
          result = mux::MultiplexResult::Failure(std::string("multiplexer error: ") + e.what());
        }
        journal->Record(MakeOutcome(job.identity, PipelineStage::kMultiplex, result.ok,
                                    result.error, result.detail));
      };
      if (IsCancelled()) {
        Logger::Warn("[PipelineRunner] STAGE_SKIPPED stage=MULTIPLEX reason=cancelled");
      }
      auto skipped =
          RunParallel(segmented_split.size(), budget.parallelism, cancel_, multiplex_one);
      for (size_t i : skipped) {
        RemoveIdentityTree(CombinedDirFor(config_, segmented_split[i]->identity));
        journal->Record(MakeOutcome(segmented_split[i]->identity, PipelineStage::kMultiplex,
                                    false, PipelineError::kCancelled, "multiplex skipped"));
      }
    }

    // =========================================================================
    // Report
    // =========================================================================
    RunSummary s;
    s.run_log_dir = run_dir;
    s.cancelled = IsCancelled();
    if (s.cancelled) journal->MarkCancelled();
    const auto outcomes = journal->Outcomes();
    s.identities = outcomes.size();
    s.failed = journal->FailedIdentities().size();
    s.published = s.identities - s.failed;
    s.degraded = s.failed > 0;

    s.report_path = ReportPathFor(config_);
    if (!journal->WriteReport(s.report_path, &error)) {
      Logger::Error("[PipelineRunner] REPORT_WRITE_FAILED " + error);
      s.report_path.clear();
    }
    for (const auto& o : outcomes) {
      if (o.ok) continue;
      std::ostringstream oss;
      oss << "[PipelineRunner] IDENTITY_FAILED identity=" << o.identity.Name()
          << " stage=" << PipelineStageToString(o.stage)
          << " error=" << PipelineErrorToString(o.error) << " detail=" << o.detail;
      Logger::Warn(oss.str());
    }
    std::ostringstream oss;
    oss << "[PipelineRunner] RUN_DONE identities=" << s.identities
        << " published=" << s.published << " failed=" << s.failed
        << " cancelled=" << (s.cancelled ? "true" : "false")
        << " exit_code=" << s.ExitCode();
    Logger::Info(oss.str());
    return s;
  }();

  if (summary.run_log_dir.empty()) summary.run_log_dir = run_dir;
  Logger::SetLogFile("");
  return summary;
}

}  // namespace v3cdash::pipeline
