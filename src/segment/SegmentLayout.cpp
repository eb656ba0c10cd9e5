// Repository: V3CDash
// Component: Segment Layout Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/segment/SegmentLayout.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#include "v3cdash/util/Logger.hpp"

namespace fs = std::filesystem;

namespace v3cdash::segment {

using util::Logger;

std::string SegmentFileName(uint32_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "segment_%04u.bin", index);
  return buf;
}

std::optional<uint32_t> ParseSegmentFileName(const std::string& name) {
  static const std::string kPrefix = "segment_";
  static const std::string kSuffix = ".bin";
  if (name.size() < kPrefix.size() + 4 + kSuffix.size()) return std::nullopt;
  if (name.compare(0, kPrefix.size(), kPrefix) != 0) return std::nullopt;
  if (name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) {
    return std::nullopt;
  }
  const std::string digits =
      name.substr(kPrefix.size(), name.size() - kPrefix.size() - kSuffix.size());
  if (digits.size() > 9) return std::nullopt;
  uint32_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0) return std::nullopt;
  // Reject non-canonical spellings such as segment_00001.bin.
  if (SegmentFileName(value) != name) return std::nullopt;
  return value;
}

std::string JoinPath(const std::string& a, const std::string& b) {
  return (fs::path(a) / b).string();
}

bool RemoveTree(const std::string& path, std::string* error) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    *error = "cannot remove " + path + ": " + ec.message();
    return false;
  }
  return true;
}

bool MakeDirs(const std::string& path, std::string* error) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    *error = "cannot create " + path + ": " + ec.message();
    return false;
  }
  return true;
}

// =============================================================================
// StagedDirectory
// =============================================================================

StagedDirectory::StagedDirectory(std::string final_path) : final_path_(std::move(final_path)) {
  fs::path p(final_path_);
  if (!p.has_filename()) p = p.parent_path();
  final_path_ = p.string();
  staging_path_ = (p.parent_path() / ("." + p.filename().string() + ".staging")).string();
}

StagedDirectory::~StagedDirectory() {
  if (prepared_ && !published_) {
    std::string error;
    if (!RemoveTree(staging_path_, &error)) {
      Logger::Warn("[StagedDirectory] STAGING_CLEANUP_FAILED " + error);
    }
  }
}

bool StagedDirectory::Prepare(std::string* error) {
  if (!RemoveTree(staging_path_, error)) return false;
  if (!MakeDirs(staging_path_, error)) return false;
  prepared_ = true;
  published_ = false;
  return true;
}

bool StagedDirectory::Publish(std::string* error) {
  if (!prepared_) {
    *error = "staging directory was never prepared";
    return false;
  }
  if (!RemoveTree(final_path_, error)) return false;
  std::error_code ec;
  fs::rename(staging_path_, final_path_, ec);
  if (ec) {
    *error = "cannot publish " + staging_path_ + " -> " + final_path_ + ": " + ec.message();
    return false;
  }
  published_ = true;
  return true;
}

void StagedDirectory::Abandon() {
  std::string error;
  if (!RemoveTree(staging_path_, &error)) {
    Logger::Warn("[StagedDirectory] STAGING_CLEANUP_FAILED " + error);
  }
  if (!RemoveTree(final_path_, &error)) {
    Logger::Warn("[StagedDirectory] PUBLISHED_CLEANUP_FAILED " + error);
  }
  prepared_ = false;
  published_ = false;
}

}  // namespace v3cdash::segment
