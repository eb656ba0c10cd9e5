// Repository: V3CDash
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for concurrent writers.
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace v3cdash::util {

std::mutex Logger::mutex_;
std::ofstream Logger::log_file_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) {
    log_file_.close();
  }
  if (path.empty()) return true;
  log_file_.open(path, std::ios::app);
  return log_file_.is_open();
}

// Caller holds mutex_.
void Logger::MirrorToFile(const char* level, const std::string& line) {
  if (!log_file_.is_open()) return;
  log_file_ << '[' << level << "] " << line << '\n';
  log_file_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  MirrorToFile("INFO", line);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("V3CDASH_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  MirrorToFile("DEBUG", line);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  MirrorToFile("WARNING", line);
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  MirrorToFile("ERROR", line);
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace v3cdash::util
