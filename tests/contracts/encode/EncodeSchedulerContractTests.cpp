// Repository: V3CDash
// Component: Encode Scheduler Contract Tests
// Purpose: Concurrency bound, exactly-once dispatch, failure isolation and
//          cancellation of the bounded encode pool.
// Copyright (c) 2025 V3CDash Contributors

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "v3cdash/encode/EncodeScheduler.hpp"

namespace v3cdash::encode {
namespace {

// Sleeps for work_ms (or until cancelled) and records how many encodes
// overlap.
class FakeLauncher : public IEncoderLauncher {
 public:
  explicit FakeLauncher(int work_ms) : work_ms_(work_ms) {}

  void FailIdentity(const std::string& name) { fail_.insert(name); }
  void ThrowForIdentity(const std::string& name) { throw_.insert(name); }

  EncodeOutcome Encode(const EncodeJob& job, const std::atomic<bool>& cancel) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++in_flight_;
      peak_ = std::max(peak_, in_flight_);
      ++calls_[job.Name()];
    }
    started_.fetch_add(1);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(work_ms_);
    bool cancelled = false;
    while (std::chrono::steady_clock::now() < deadline) {
      if (cancel.load()) {
        cancelled = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --in_flight_;
    }
    if (throw_.count(job.Name()) > 0) throw std::runtime_error("launcher exploded");
    if (cancelled) return EncodeOutcome::Cancelled("encode cancelled");
    if (fail_.count(job.Name()) > 0) return EncodeOutcome::Failed("injected failure");
    return EncodeOutcome::Succeeded(job.output_path);
  }

  int peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }
  std::map<std::string, int> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  int started() const { return started_.load(); }

 private:
  const int work_ms_;
  std::set<std::string> fail_;
  std::set<std::string> throw_;

  mutable std::mutex mutex_;
  int in_flight_ = 0;
  int peak_ = 0;
  std::map<std::string, int> calls_;
  std::atomic<int> started_{0};
};

std::vector<EncodeJob> MakeJobs(int tiles, int qualities) {
  std::vector<EncodeJob> jobs;
  for (int t = 0; t < tiles; ++t) {
    for (int q = 0; q < qualities; ++q) {
      EncodeJob job;
      job.identity.project = "proj";
      job.identity.tile_id = t;
      job.identity.quality = QualityTriplet{24 + q, 32 + q, 43 + q};
      job.output_path = "/tmp/encoded/" + job.Name() + ".bin";
      jobs.push_back(job);
    }
  }
  return jobs;
}

// =============================================================================
// Concurrency bound
// =============================================================================

TEST(EncodeSchedulerContract, NeverExceedsMaxConcurrentEncodes) {
  FakeLauncher launcher(30);
  EncodeScheduler scheduler(launcher, 3);
  auto jobs = scheduler.Run(MakeJobs(4, 2));

  ASSERT_EQ(jobs.size(), 8u);
  for (const auto& job : jobs) {
    EXPECT_EQ(job.state, EncodeJobState::kSucceeded) << job.Name();
    EXPECT_TRUE(job.outcome.ok);
  }
  EXPECT_LE(launcher.peak(), 3);
  EXPECT_GE(launcher.peak(), 1);
  EXPECT_LE(scheduler.PeakRunning(), 3);
  EXPECT_EQ(scheduler.RunningCount(), 0);
}

TEST(EncodeSchedulerContract, SingleSlotRunsSerially) {
  FakeLauncher launcher(5);
  EncodeScheduler scheduler(launcher, 1);
  scheduler.Run(MakeJobs(2, 3));
  EXPECT_EQ(launcher.peak(), 1);
}

TEST(EncodeSchedulerContract, BudgetOfFourSingleThreadEncodersAllowsFour) {
  auto budget = ThreadBudget::Resolve(4, 1);
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, budget.MaxConcurrentEncodes());
  EXPECT_EQ(scheduler.max_concurrent_encodes(), 4);

  auto narrow = ThreadBudget::Resolve(4, 3);
  EncodeScheduler narrow_scheduler(launcher, narrow.MaxConcurrentEncodes());
  EXPECT_EQ(narrow_scheduler.max_concurrent_encodes(), 1);
}

TEST(EncodeSchedulerContract, NonPositiveBoundIsClampedToOne) {
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, 0);
  EXPECT_EQ(scheduler.max_concurrent_encodes(), 1);
}

// =============================================================================
// Exactly once, input order
// =============================================================================

TEST(EncodeSchedulerContract, EveryJobLaunchedExactlyOnceInInputOrder) {
  FakeLauncher launcher(2);
  EncodeScheduler scheduler(launcher, 4);
  const auto input = MakeJobs(3, 3);
  auto jobs = scheduler.Run(input);

  ASSERT_EQ(jobs.size(), input.size());
  const auto calls = launcher.calls();
  EXPECT_EQ(calls.size(), input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    EXPECT_EQ(jobs[i].Name(), input[i].Name());
    EXPECT_EQ(calls.at(input[i].Name()), 1);
  }
}

TEST(EncodeSchedulerContract, EmptyJobListCompletes) {
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, 2);
  EXPECT_TRUE(scheduler.Run({}).empty());
}

TEST(EncodeSchedulerContract, DuplicateIdentityIsRejected) {
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, 2);
  auto jobs = MakeJobs(1, 1);
  jobs.push_back(jobs.front());
  EXPECT_THROW(scheduler.Run(jobs), std::invalid_argument);
  EXPECT_EQ(launcher.started(), 0);
}

TEST(EncodeSchedulerContract, SharedOutputPathIsRejected) {
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, 2);
  auto jobs = MakeJobs(1, 2);
  jobs[1].output_path = jobs[0].output_path;
  EXPECT_THROW(scheduler.Run(jobs), std::invalid_argument);
}

// =============================================================================
// Failure isolation
// =============================================================================

TEST(EncodeSchedulerContract, FailedJobDoesNotStopSiblings) {
  auto input = MakeJobs(3, 2);
  FakeLauncher launcher(5);
  launcher.FailIdentity(input[2].Name());
  launcher.ThrowForIdentity(input[4].Name());

  EncodeScheduler scheduler(launcher, 2);
  std::atomic<int> finished{0};
  scheduler.SetJobFinishedCallback([&](const EncodeJob& job) {
    EXPECT_TRUE(IsTerminal(job.state));
    finished.fetch_add(1);
  });
  auto jobs = scheduler.Run(input);

  EXPECT_EQ(finished.load(), 6);
  for (size_t i = 0; i < jobs.size(); ++i) {
    if (i == 2 || i == 4) {
      EXPECT_EQ(jobs[i].state, EncodeJobState::kFailed);
      EXPECT_EQ(jobs[i].outcome.error, PipelineError::kEncodeJobFailure);
    } else {
      EXPECT_EQ(jobs[i].state, EncodeJobState::kSucceeded) << jobs[i].Name();
    }
  }
  EXPECT_NE(jobs[4].outcome.reason.find("launcher exploded"), std::string::npos);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST(EncodeSchedulerContract, CancelStopsDispatchAndFailsPendingJobs) {
  FakeLauncher launcher(5000);
  EncodeScheduler scheduler(launcher, 2);
  std::atomic<int> finished{0};
  scheduler.SetJobFinishedCallback([&](const EncodeJob&) { finished.fetch_add(1); });

  std::thread canceller([&]() {
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (launcher.started() < 2 && std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    scheduler.Cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  auto jobs = scheduler.Run(MakeJobs(3, 2));
  canceller.join();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(scheduler.IsCancelled());
  EXPECT_LT(elapsed, std::chrono::seconds(4));
  EXPECT_EQ(launcher.started(), 2);
  EXPECT_EQ(finished.load(), 6);
  for (const auto& job : jobs) {
    EXPECT_EQ(job.state, EncodeJobState::kFailed) << job.Name();
    EXPECT_EQ(job.outcome.error, PipelineError::kCancelled) << job.Name();
  }
}

TEST(EncodeSchedulerContract, CancelBeforeRunLaunchesNothing) {
  FakeLauncher launcher(1);
  EncodeScheduler scheduler(launcher, 2);
  scheduler.Cancel();
  auto jobs = scheduler.Run(MakeJobs(2, 1));
  EXPECT_EQ(launcher.started(), 0);
  for (const auto& job : jobs) {
    EXPECT_EQ(job.outcome.error, PipelineError::kCancelled);
  }
}

}  // namespace
}  // namespace v3cdash::encode
