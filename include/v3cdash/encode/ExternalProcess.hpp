// Repository: V3CDash
// Component: External Process
// Purpose: Runs one child process to completion with its output captured to
//          a log file, honouring a cancel flag (SIGTERM to the process group,
//          grace period, then SIGKILL).
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_EXTERNAL_PROCESS_HPP_
#define V3CDASH_ENCODE_EXTERNAL_PROCESS_HPP_

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace v3cdash::encode {

struct ProcessSpec {
  std::string program;             // resolved through PATH when it has no '/'
  std::vector<std::string> args;   // argv[1..]
  std::string log_path;            // stdout+stderr, appended; empty = /dev/null
  std::string working_dir;         // empty = inherit
};

struct ProcessResult {
  enum class Status {
    kExited,       // exit_code is valid
    kSignaled,     // terminated by signal_number, not by us
    kCancelled,    // stopped because cancel was set
    kSpawnFailed,  // log open, fork or exec failed; see error
  };

  Status status = Status::kSpawnFailed;
  int exit_code = -1;
  int signal_number = 0;
  std::string error;

  bool Succeeded() const { return status == Status::kExited && exit_code == 0; }

  // Human-readable summary for logs and failure reasons.
  std::string Describe() const;
};

class ExternalProcess {
 public:
  static constexpr std::chrono::milliseconds kDefaultGracePeriod{5000};
  static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

  // Blocks until the child exits or cancel is observed. The child runs in
  // its own process group so encoder helpers are signalled with it.
  static ProcessResult Run(const ProcessSpec& spec, const std::atomic<bool>& cancel,
                           std::chrono::milliseconds grace_period = kDefaultGracePeriod,
                           std::chrono::milliseconds poll_interval = kDefaultPollInterval);
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_EXTERNAL_PROCESS_HPP_
