// Repository: V3CDash
// Component: Bitstream Segmenter
// Purpose: Turns one encoded V3C container into an init segment plus
//          GoF-aligned media segments per component, published atomically
//          under the identity directory together with segment_index.json.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_SEGMENT_BITSTREAM_SEGMENTER_HPP_
#define V3CDASH_SEGMENT_BITSTREAM_SEGMENTER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "v3cdash/bitstream/V3cSampleStream.hpp"
#include "v3cdash/core/PipelineTypes.hpp"
#include "v3cdash/segment/SegmentIndex.hpp"

namespace v3cdash::segment {

// One media segment's GoF and frame window.
struct SegmentWindow {
  uint32_t index = 0;        // 1-based
  uint32_t first_gof = 0;    // 0-based
  uint32_t gof_count = 0;
  uint32_t first_frame = 0;  // offset from tile start
  uint32_t frame_count = 0;
};

// Frames carried by each of gof_count GoFs. expected_frames == 0 means
// unknown: every GoF is assumed full.
std::vector<uint32_t> GofFrameCounts(size_t gof_count, const GofPlan& plan,
                                     int64_t expected_frames);

// Folds GoFs into windows of plan.GofsPerSegment(); the last may be short.
std::vector<SegmentWindow> PlanSegmentWindows(const std::vector<uint32_t>& gof_frames,
                                              const GofPlan& plan);

// Writes <dir>/init.bin and one segment file per window, in ascending index
// order, and records them in *out. gofs holds the media units of every GoF.
bool WriteComponentSegments(const std::string& dir, ComponentKind kind,
                            const std::vector<bitstream::V3cUnit>& init_units,
                            const std::vector<std::vector<bitstream::V3cUnit>>& gofs,
                            const std::vector<SegmentWindow>& windows,
                            ComponentIndex* out, std::string* error);

struct SegmentRequest {
  std::string container_path;
  std::string output_dir;  // identity root, replaced wholesale on success
  std::string project;
  std::string identity;
  int32_t tile_id = -1;
  QualityTriplet quality;
  GofPlan gof_plan;
  double frame_rate = 30.0;
  int64_t expected_frames = 0;  // 0 = unknown, skip the frame-count check
  bool split_components = true;
  std::vector<SegmentBounds> tile_bounds;
};

struct SegmentationResult {
  bool ok;
  PipelineError error;
  std::string detail;
  SegmentIndex index;  // valid when ok

  static SegmentationResult Success(SegmentIndex index) {
    return {true, PipelineError::kNone, "", std::move(index)};
  }
  static SegmentationResult Failure(const std::string& detail) {
    return {false, PipelineError::kSegmentationFailure, detail, SegmentIndex{}};
  }
};

// Stateless; concurrent calls on different identities are safe.
class BitstreamSegmenter {
 public:
  // On failure no segment files remain under request.output_dir, including
  // those of an earlier successful run.
  static SegmentationResult Segment(const SegmentRequest& request);
};

}  // namespace v3cdash::segment

#endif  // V3CDASH_SEGMENT_BITSTREAM_SEGMENTER_HPP_
