// Repository: V3CDash
// Component: Segment Layout
// Purpose: On-disk naming of segment trees and staged write + atomic publish
//          of one identity directory.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_SEGMENT_SEGMENT_LAYOUT_HPP_
#define V3CDASH_SEGMENT_SEGMENT_LAYOUT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace v3cdash::segment {

inline constexpr const char* kInitFileName = "init.bin";
inline constexpr const char* kIndexFileName = "segment_index.json";

// segment_0001.bin for index 1.
std::string SegmentFileName(uint32_t index);

// Inverse of SegmentFileName. nullopt for anything else (including index 0).
std::optional<uint32_t> ParseSegmentFileName(const std::string& name);

std::string JoinPath(const std::string& a, const std::string& b);

// Removes path recursively. Missing path is not an error.
bool RemoveTree(const std::string& path, std::string* error);

// Creates path and its parents.
bool MakeDirs(const std::string& path, std::string* error);

// StagedDirectory: write-then-rename publication of one directory tree.
//
// Content is written under <parent>/.<name>.staging and moved to
// <parent>/<name> by Publish(). A previously published tree is replaced
// wholesale. Abandon() removes both the staging tree and any published
// tree, so a failed identity leaves nothing behind. The destructor
// removes an unpublished staging tree.
class StagedDirectory {
 public:
  explicit StagedDirectory(std::string final_path);
  ~StagedDirectory();

  StagedDirectory(const StagedDirectory&) = delete;
  StagedDirectory& operator=(const StagedDirectory&) = delete;

  // Clears any stale staging tree and creates a fresh one.
  bool Prepare(std::string* error);

  bool Publish(std::string* error);

  void Abandon();

  const std::string& final_path() const { return final_path_; }
  const std::string& staging_path() const { return staging_path_; }
  bool published() const { return published_; }

 private:
  std::string final_path_;
  std::string staging_path_;
  bool prepared_ = false;
  bool published_ = false;
};

}  // namespace v3cdash::segment

#endif  // V3CDASH_SEGMENT_SEGMENT_LAYOUT_HPP_
