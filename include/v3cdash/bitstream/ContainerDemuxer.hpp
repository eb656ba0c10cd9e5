// Repository: V3CDash
// Component: Container Demuxer
// Purpose: Splits a parsed V3C sample stream into per-component streams,
//          grouped by GoF, with parameter units extracted for the init
//          segment. Layout (split vs combined) is resolved once per container.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_BITSTREAM_CONTAINER_DEMUXER_HPP_
#define V3CDASH_BITSTREAM_CONTAINER_DEMUXER_HPP_

#include <optional>
#include <string>
#include <vector>

#include "v3cdash/bitstream/V3cSampleStream.hpp"
#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash::bitstream {

// Units of one component, ordered by GoF.
struct ComponentStream {
  ComponentKind kind = ComponentKind::kCombined;
  std::vector<V3cUnit> init_units;           // parameter units, deduplicated
  std::vector<std::vector<V3cUnit>> gofs;    // media units per GoF, container order
};

struct DemuxedContainer {
  ContainerLayout layout = ContainerLayout::kCombined;
  // Split was requested but packed video forced the combined layout.
  bool packed_video_downgrade = false;
  size_t gof_count = 0;
  // Split: present components in kSplitComponentOrder. Combined: one stream.
  std::vector<ComponentStream> streams;
};

struct DemuxResult {
  bool ok;
  std::string error;

  static DemuxResult Success() { return {true, ""}; }
  static DemuxResult Failure(const std::string& error) { return {false, error}; }
};

// Maps a media unit type to its split component. VPS/CAD/PVD have none.
std::optional<ComponentKind> ComponentForUnit(V3cUnitType type);

// Appends unit to units unless a byte-identical unit is already there.
void AppendUnique(std::vector<V3cUnit>* units, const V3cUnit& unit);

class ContainerDemuxer {
 public:
  // Every AD unit opens a GoF. Failure when a media unit precedes the first
  // AD, when the stream has no AD, or (split) when a component is missing
  // from some GoF.
  static DemuxResult Demux(const SampleStream& stream, bool split_components,
                           DemuxedContainer* out);
};

}  // namespace v3cdash::bitstream

#endif  // V3CDASH_BITSTREAM_CONTAINER_DEMUXER_HPP_
