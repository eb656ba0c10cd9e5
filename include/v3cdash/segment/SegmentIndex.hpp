// Repository: V3CDash
// Component: Segment Index
// Purpose: Per-identity segment metadata handed to manifest assembly.
//          C++ mirror of v3cdash.index.v1.SegmentIndex, persisted as
//          segment_index.json at the identity root.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_SEGMENT_SEGMENT_INDEX_HPP_
#define V3CDASH_SEGMENT_SEGMENT_INDEX_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash::index::v1 {
class SegmentIndex;
}  // namespace v3cdash::index::v1

namespace v3cdash::segment {

inline constexpr uint32_t kSegmentIndexSchemaVersion = 1;

struct SegmentEntry {
  uint32_t index = 0;           // 1-based
  std::string file_name;
  uint64_t size_bytes = 0;
  uint32_t frame_count = 0;
  uint32_t first_frame = 0;     // offset from tile start
  uint32_t gof_count = 0;
  std::vector<uint32_t> gof_unit_counts;

  uint32_t UnitCount() const;
};

struct ComponentIndex {
  ComponentKind component = ComponentKind::kCombined;
  std::string init_file;
  uint64_t init_size_bytes = 0;
  uint32_t init_unit_count = 0;
  std::vector<SegmentEntry> segments;
};

struct SegmentIndex {
  uint32_t schema_version = kSegmentIndexSchemaVersion;
  std::string project;
  std::string identity;
  int32_t tile_id = -1;
  QualityTriplet quality;
  GofPlan gof_plan;
  double frame_rate = 30.0;
  ContainerLayout layout = ContainerLayout::kCombined;
  uint32_t total_frames = 0;
  uint32_t total_gofs = 0;
  std::vector<ComponentIndex> components;
  std::vector<SegmentBounds> tile_bounds;

  // nullptr when the component is not listed.
  const ComponentIndex* FindComponent(ComponentKind kind) const;
};

void ToProto(const SegmentIndex& index, ::v3cdash::index::v1::SegmentIndex* out);

// Rejects unknown component names and layouts.
bool FromProto(const ::v3cdash::index::v1::SegmentIndex& in, SegmentIndex* out,
               std::string* error);

bool WriteSegmentIndexFile(const std::string& path, const SegmentIndex& index,
                           std::string* error);
bool ReadSegmentIndexFile(const std::string& path, SegmentIndex* index, std::string* error);

}  // namespace v3cdash::segment

#endif  // V3CDASH_SEGMENT_SEGMENT_INDEX_HPP_
