// Repository: V3CDash
// Component: Encode Scheduler
// Purpose: Bounded worker pool that runs every EncodeJob exactly once with at
//          most max_concurrent_encodes external encoders in flight.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_ENCODE_SCHEDULER_HPP_
#define V3CDASH_ENCODE_ENCODE_SCHEDULER_HPP_

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "v3cdash/encode/EncodeJob.hpp"
#include "v3cdash/encode/IEncoderLauncher.hpp"

namespace v3cdash::encode {

// EncodeScheduler: fixed pool of OS threads over one shared job queue.
//
// Each worker takes the next Pending job, holds its slot for the full
// launcher call, records the terminal state and takes the next job. A
// failed job never stops its siblings. Cancel() stops dispatch and is
// forwarded to in-flight launchers; jobs still queued are marked Failed
// with kCancelled.
//
// The queue is the only structure shared between workers and is guarded
// by mutex_.
class EncodeScheduler {
 public:
  using JobFinishedFn = std::function<void(const EncodeJob&)>;

  // launcher must outlive the scheduler.
  EncodeScheduler(IEncoderLauncher& launcher, int max_concurrent_encodes);

  EncodeScheduler(const EncodeScheduler&) = delete;
  EncodeScheduler& operator=(const EncodeScheduler&) = delete;

  // Blocks until every job is terminal and returns them in input order.
  // Throws std::invalid_argument if two jobs share an identity or an
  // output path.
  std::vector<EncodeJob> Run(std::vector<EncodeJob> jobs);

  // Thread-safe; may be called from a signal watcher at any time.
  void Cancel();
  bool IsCancelled() const { return cancel_.load(std::memory_order_acquire); }

  // Invoked on the worker thread after each job reaches a terminal state.
  void SetJobFinishedCallback(JobFinishedFn fn);

  int max_concurrent_encodes() const { return max_concurrent_; }
  int RunningCount() const;
  int PeakRunning() const;

 private:
  void WorkerLoop(std::vector<EncodeJob>* jobs);

  IEncoderLauncher& launcher_;
  const int max_concurrent_;

  mutable std::mutex mutex_;
  std::deque<size_t> queue_;  // indices into the job vector
  int running_ = 0;           // Guarded by mutex_
  int peak_running_ = 0;      // Guarded by mutex_

  std::atomic<bool> cancel_{false};
  JobFinishedFn on_finished_;
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_ENCODE_SCHEDULER_HPP_
