// Repository: V3CDash
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for concurrent writers.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_UTIL_LOGGER_HPP_
#define V3CDASH_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace v3cdash::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from encode workers, segmentation workers and the
// signal watcher never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when V3CDASH_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failed identities, fatal configuration)
//
// SetLogFile mirrors every emitted line, tagged with its level, into the
// per-run log file. Passing an empty path closes it.
//
// Test-only: SetErrorSink / SetInfoSink install callbacks invoked for every
// Error() / Info() line (in addition to the console).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Returns false if the file cannot be opened for append.
  static bool SetLogFile(const std::string& path);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static void MirrorToFile(const char* level, const std::string& line);

  static std::mutex mutex_;
  static std::ofstream log_file_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace v3cdash::util

#endif  // V3CDASH_UTIL_LOGGER_HPP_
