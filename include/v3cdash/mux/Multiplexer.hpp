// Repository: V3CDash
// Component: Multiplexer
// Purpose: Recombines one identity's split component segment sets into a
//          single interleaved "combined" segment set.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_MUX_MULTIPLEXER_HPP_
#define V3CDASH_MUX_MULTIPLEXER_HPP_

#include <string>

#include "v3cdash/core/PipelineTypes.hpp"
#include "v3cdash/segment/SegmentIndex.hpp"

namespace v3cdash::mux {

struct MultiplexRequest {
  std::string input_root;   // split identity directory with segment_index.json
  std::string output_root;  // receives combined/ and segment_index.json
};

struct MultiplexResult {
  bool ok;
  PipelineError error;
  std::string detail;
  segment::SegmentIndex index;  // combined index, valid when ok

  static MultiplexResult Success(segment::SegmentIndex index) {
    return {true, PipelineError::kNone, "", std::move(index)};
  }
  static MultiplexResult Failure(const std::string& detail) {
    return {false, PipelineError::kMultiplexMismatch, detail, segment::SegmentIndex{}};
  }
};

// Multiplexer: inverse of split segmentation.
//
// Every component set is validated before anything is written:
//   - atlas, occp and geom are mandatory; attr is optional
//   - the index and the component directories list the same components
//   - each directory holds init.bin and segment_0001..N without gaps
//   - N, per-segment frame_count and gof_count agree across components
//   - each segment's unit count matches its recorded gof_unit_counts
//
// Combined segment i carries, per GoF, the atlas, occupancy, geometry and
// attribute units in that order. The combined init is the union of the
// component inits with byte-identical units dropped. On failure the output
// root is removed.
class Multiplexer {
 public:
  static MultiplexResult Multiplex(const MultiplexRequest& request);
};

}  // namespace v3cdash::mux

#endif  // V3CDASH_MUX_MULTIPLEXER_HPP_
