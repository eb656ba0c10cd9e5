// Repository: V3CDash
// Component: Encode Scheduler Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/encode/EncodeScheduler.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "v3cdash/util/Logger.hpp"

namespace v3cdash::encode {

using util::Logger;

EncodeScheduler::EncodeScheduler(IEncoderLauncher& launcher, int max_concurrent_encodes)
    : launcher_(launcher), max_concurrent_(std::max(1, max_concurrent_encodes)) {}

void EncodeScheduler::Cancel() {
  if (!cancel_.exchange(true, std::memory_order_acq_rel)) {
    Logger::Warn("[EncodeScheduler] CANCEL_REQUESTED");
  }
}

void EncodeScheduler::SetJobFinishedCallback(JobFinishedFn fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_finished_ = std::move(fn);
}

int EncodeScheduler::RunningCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

int EncodeScheduler::PeakRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_running_;
}

std::vector<EncodeJob> EncodeScheduler::Run(std::vector<EncodeJob> jobs) {
  std::set<std::string> identities;
  std::set<std::string> outputs;
  for (const auto& job : jobs) {
    if (!identities.insert(job.Name()).second) {
      throw std::invalid_argument("duplicate encode job identity: " + job.Name());
    }
    if (!outputs.insert(job.output_path).second) {
      throw std::invalid_argument("duplicate encode output path: " + job.output_path);
    }
  }

  const int workers = static_cast<int>(
      std::min<size_t>(static_cast<size_t>(max_concurrent_), jobs.size()));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    for (size_t i = 0; i < jobs.size(); ++i) {
      jobs[i].state = EncodeJobState::kPending;
      queue_.push_back(i);
    }
    running_ = 0;
    peak_running_ = 0;
  }

  {
    std::ostringstream oss;
    oss << "[EncodeScheduler] RUN_START jobs=" << jobs.size() << " workers=" << workers
        << " max_concurrent_encodes=" << max_concurrent_;
    Logger::Info(oss.str());
  }

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (int i = 0; i < workers; ++i) {
    pool.emplace_back(&EncodeScheduler::WorkerLoop, this, &jobs);
  }
  for (auto& t : pool) t.join();

  // Anything still queued was never started.
  std::deque<size_t> leftover;
  JobFinishedFn on_finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leftover.swap(queue_);
    on_finished = on_finished_;
  }
  for (size_t index : leftover) {
    EncodeJob& job = jobs[index];
    job.state = EncodeJobState::kFailed;
    job.outcome = EncodeOutcome::Cancelled("cancelled before start");
    if (on_finished) on_finished(job);
  }

  size_t succeeded = 0;
  for (const auto& job : jobs) {
    if (job.state == EncodeJobState::kSucceeded) ++succeeded;
  }
  std::ostringstream oss;
  oss << "[EncodeScheduler] RUN_DONE succeeded=" << succeeded
      << " failed=" << (jobs.size() - succeeded) << " peak_running=" << PeakRunning()
      << " cancelled=" << (IsCancelled() ? "true" : "false");
  Logger::Info(oss.str());
  return jobs;
}

void EncodeScheduler::WorkerLoop(std::vector<EncodeJob>* jobs) {
  while (true) {
    size_t index = 0;
    JobFinishedFn on_finished;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty() || cancel_.load(std::memory_order_acquire)) return;
      index = queue_.front();
      queue_.pop_front();
      (*jobs)[index].state = EncodeJobState::kRunning;
      ++running_;
      peak_running_ = std::max(peak_running_, running_);
      on_finished = on_finished_;
    }

    EncodeJob& job = (*jobs)[index];
    Logger::Debug("[EncodeScheduler] JOB_START identity=" + job.Name());

    EncodeOutcome outcome;
    try {
      outcome = launcher_.Encode(job, cancel_);
    } catch (const std::exception& e) {
      outcome = EncodeOutcome::Failed(std::string("launcher error: ") + e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      job.outcome = outcome;
      job.state = outcome.ok ? EncodeJobState::kSucceeded : EncodeJobState::kFailed;
      --running_;
    }

    std::ostringstream oss;
    if (outcome.ok) {
      oss << "[EncodeScheduler] JOB_SUCCEEDED identity=" << job.Name()
          << " output=" << outcome.output_path;
      Logger::Info(oss.str());
    } else {
      oss << "[EncodeScheduler] JOB_FAILED identity=" << job.Name()
          << " error=" << PipelineErrorToString(outcome.error) << " reason=" << outcome.reason;
      Logger::Error(oss.str());
    }
    if (on_finished) on_finished(job);
  }
}

}  // namespace v3cdash::encode
