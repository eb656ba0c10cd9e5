// Repository: V3CDash
// Component: Tile Catalog
// Purpose: Reads the tiling stage's output: tile_<id>/ directories of
//          numbered .ply frames and the optional tile_boundaries.json.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_PIPELINE_TILE_CATALOG_HPP_
#define V3CDASH_PIPELINE_TILE_CATALOG_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash::pipeline {

inline constexpr const char* kTileBoundariesFileName = "tile_boundaries.json";

// Numbered frame files of one tile, e.g. frame_0010.ply .. frame_0049.ply.
struct FrameSequence {
  std::string pattern;      // frame_%04d.ply
  int64_t start_frame = 0;  // lowest number
  int64_t frame_count = 0;
  std::string first_file;   // file name of start_frame
};

struct CatalogResult {
  bool ok;
  std::string error;

  static CatalogResult Success() { return {true, ""}; }
  static CatalogResult Failure(const std::string& error) { return {false, error}; }
};

class TileCatalog {
 public:
  // Scans project_dir for tile_<id>/ directories, ordered by id. Attaches
  // per-segment bounds from <project_dir>/tile_boundaries.json when present.
  // Failure when no tile exists or a tile has no usable frame sequence.
  static CatalogResult Discover(const std::string& project_dir, std::vector<Tile>* tiles);

  // All names must share one prefix, digit width and suffix; numbers must be
  // contiguous. Non-.ply names are ignored.
  static CatalogResult DescribeFrames(const std::vector<std::string>& file_names,
                                      FrameSequence* out);

  // { "<segment>": [ {id, xmin, xmax, ymin, ymax, zmin, zmax}, ... ], ... }
  static CatalogResult LoadBoundaries(
      const std::string& path, std::map<int32_t, std::vector<SegmentBounds>>* by_tile);

  // Geometry bit depth from a "vox<N>" token, e.g. longdress_vox10_0001.ply.
  static std::optional<int> InferVox(const std::string& frame_name);
};

}  // namespace v3cdash::pipeline

#endif  // V3CDASH_PIPELINE_TILE_CATALOG_HPP_
