// Repository: V3CDash
// Component: Pipeline Types
// Purpose: Shared value types for encode scheduling, segmentation and
//          multiplexing (budget, tiles, quality triplets, GoF plan, errors).
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_CORE_PIPELINE_TYPES_HPP_
#define V3CDASH_CORE_PIPELINE_TYPES_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace v3cdash {

// =============================================================================
// Error Codes
// Every recoverable failure is recorded against one bitstream identity.
// =============================================================================

enum class PipelineError {
  kNone = 0,

  // Fatal: rejected before any job is scheduled.
  kConfigInvariantViolation,

  // External encoder exited non-zero, or produced an empty/corrupt container.
  kEncodeJobFailure,

  // Container unparsable, or GoF count inconsistent with the tile frame count.
  kSegmentationFailure,

  // Component segment sets disagree (count, frames, missing component).
  kMultiplexMismatch,

  // Stop requested while the identity was pending or in flight.
  kCancelled,
};

const char* PipelineErrorToString(PipelineError error);

enum class PipelineStage {
  kEncode,
  kSegment,
  kMultiplex,
};

const char* PipelineStageToString(PipelineStage stage);

// =============================================================================
// Thread Budget
// max_concurrent_encodes = max(1, parallelism / threads_per_instance)
// =============================================================================

struct ThreadBudget {
  int parallelism = 1;
  int threads_per_instance = 1;

  // Clamps threads_per_instance into [1, parallelism]. A missing request
  // resolves to one thread per encoder instance.
  static ThreadBudget Resolve(int parallelism,
                              std::optional<int> requested_threads_per_instance);

  int MaxConcurrentEncodes() const;
};

// =============================================================================
// Quality Triplet
// (occupancy, geometry, attribute) quantization parameters.
// =============================================================================

struct QualityTriplet {
  int occ = 0;
  int geo = 0;
  int attr = 0;

  bool operator==(const QualityTriplet& other) const {
    return occ == other.occ && geo == other.geo && attr == other.attr;
  }
  bool operator!=(const QualityTriplet& other) const { return !(*this == other); }
};

// Whole-string decimal integer. False on any other character or when the
// value does not fit *out.
bool ParseInteger(const std::string& text, int* out);
bool ParseInteger(const std::string& text, int64_t* out);

// "24:32:43,28:36:45" -> triplets. Returns false and sets *error on bad syntax.
bool ParseQualityTriplets(const std::string& text,
                          std::vector<QualityTriplet>* out,
                          std::string* error);

std::string FormatQualityTriplet(const QualityTriplet& q);

// =============================================================================
// Tile
// Produced by the tiling stage; read-only here.
// =============================================================================

struct SpatialBounds {
  double x_min = 0.0;
  double x_max = 0.0;
  double y_min = 0.0;
  double y_max = 0.0;
  double z_min = 0.0;
  double z_max = 0.0;
};

// Tile extent during one segment window (tiling recomputes the grid per window).
struct SegmentBounds {
  uint32_t segment_index = 0;  // 1-based
  SpatialBounds bounds;
};

struct Tile {
  int32_t id = 0;
  std::string directory;
  std::string frame_pattern;  // e.g. "longdress_vox10_%04d.ply"
  int64_t start_frame = 0;    // frame range is [start_frame, start_frame + frame_count)
  int64_t frame_count = 0;
  std::vector<SegmentBounds> spatial_bounds;

  int64_t EndFrame() const { return start_frame + frame_count; }
};

// =============================================================================
// GoF Plan
// segment_size % encoder_gof == 0 must hold before any job runs.
// =============================================================================

struct GofPlan {
  int segment_size = 16;
  int encoder_gof = 16;

  bool IsValid() const {
    return segment_size > 0 && encoder_gof > 0 && segment_size % encoder_gof == 0;
  }

  // Precondition: IsValid().
  int GofsPerSegment() const { return segment_size / encoder_gof; }

  // ceil(frame_count / encoder_gof)
  int64_t ExpectedGofs(int64_t frame_count) const {
    return (frame_count + encoder_gof - 1) / encoder_gof;
  }
};

// =============================================================================
// Components
// =============================================================================

enum class ComponentKind {
  kAtlas,
  kOccupancy,
  kGeometry,
  kAttribute,
  kCombined,
};

// Fixed interleave order for split components.
inline constexpr std::array<ComponentKind, 4> kSplitComponentOrder = {
    ComponentKind::kAtlas, ComponentKind::kOccupancy, ComponentKind::kGeometry,
    ComponentKind::kAttribute};

// On-disk directory name: atlas | occp | geom | attr | combined
const char* ComponentDirName(ComponentKind kind);

// Inverse of ComponentDirName.
std::optional<ComponentKind> ComponentFromDirName(const std::string& name);

// Resolved once per container.
enum class ContainerLayout {
  kSplit,
  kCombined,
};

const char* ContainerLayoutToString(ContainerLayout layout);
std::optional<ContainerLayout> ContainerLayoutFromString(const std::string& s);

// =============================================================================
// Bitstream Identity
// (tile, quality triplet): unique key of one encode job and its segment tree.
// =============================================================================

struct BitstreamIdentity {
  std::string project;
  int32_t tile_id = -1;
  QualityTriplet quality;

  // <project>_tile_<id>_occ<o>_geo<g>_attr<a>
  std::string Name() const;
};

}  // namespace v3cdash

#endif  // V3CDASH_CORE_PIPELINE_TYPES_HPP_
