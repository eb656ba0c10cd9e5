// Repository: V3CDash
// Component: Bitstream Segmenter Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/segment/BitstreamSegmenter.hpp"

#include <algorithm>
#include <sstream>

#include "v3cdash/bitstream/ContainerDemuxer.hpp"
#include "v3cdash/segment/SegmentLayout.hpp"
#include "v3cdash/util/Logger.hpp"

namespace v3cdash::segment {

using bitstream::ContainerDemuxer;
using bitstream::DemuxedContainer;
using bitstream::SampleStream;
using bitstream::V3cUnit;
using util::Logger;

std::vector<uint32_t> GofFrameCounts(size_t gof_count, const GofPlan& plan,
                                     int64_t expected_frames) {
  std::vector<uint32_t> frames(gof_count, static_cast<uint32_t>(plan.encoder_gof));
  if (expected_frames > 0 && gof_count > 0) {
    const int64_t tail =
        expected_frames - static_cast<int64_t>(gof_count - 1) * plan.encoder_gof;
    if (tail > 0 && tail <= plan.encoder_gof) {
      frames.back() = static_cast<uint32_t>(tail);
    }
  }
  return frames;
}

std::vector<SegmentWindow> PlanSegmentWindows(const std::vector<uint32_t>& gof_frames,
                                              const GofPlan& plan) {
  std::vector<SegmentWindow> windows;
  const size_t per_segment = static_cast<size_t>(plan.GofsPerSegment());
  uint32_t frame_offset = 0;
  for (size_t first = 0; first < gof_frames.size(); first += per_segment) {
    const size_t last = std::min(gof_frames.size(), first + per_segment);
    SegmentWindow window;
    window.index = static_cast<uint32_t>(windows.size() + 1);
    window.first_gof = static_cast<uint32_t>(first);
    window.gof_count = static_cast<uint32_t>(last - first);
    window.first_frame = frame_offset;
    for (size_t g = first; g < last; ++g) window.frame_count += gof_frames[g];
    frame_offset += window.frame_count;
    windows.push_back(window);
  }
  return windows;
}

bool WriteComponentSegments(const std::string& dir, ComponentKind kind,
                            const std::vector<V3cUnit>& init_units,
                            const std::vector<std::vector<V3cUnit>>& gofs,
                            const std::vector<SegmentWindow>& windows,
                            ComponentIndex* out, std::string* error) {
  if (!MakeDirs(dir, error)) return false;

  *out = ComponentIndex{};
  out->component = kind;
  out->init_file = kInitFileName;

  const auto init_bytes = bitstream::SerializeSampleStream(init_units);
  if (!bitstream::WriteFileBytes(JoinPath(dir, kInitFileName), init_bytes, error)) {
    return false;
  }
  out->init_size_bytes = init_bytes.size();
  out->init_unit_count = static_cast<uint32_t>(init_units.size());

  // Ascending index order; one writer per component directory.
  for (const auto& window : windows) {
    SegmentEntry entry;
    entry.index = window.index;
    entry.file_name = SegmentFileName(window.index);
    entry.frame_count = window.frame_count;
    entry.first_frame = window.first_frame;
    entry.gof_count = window.gof_count;

    std::vector<V3cUnit> units;
    for (uint32_t g = window.first_gof; g < window.first_gof + window.gof_count; ++g) {
      const auto& gof = gofs[g];
      entry.gof_unit_counts.push_back(static_cast<uint32_t>(gof.size()));
      units.insert(units.end(), gof.begin(), gof.end());
    }
    if (units.empty()) {
      *error = std::string(ComponentDirName(kind)) + " segment " +
               std::to_string(window.index) + " holds no units";
      return false;
    }

    const auto bytes = bitstream::SerializeSampleStream(units);
    if (!bitstream::WriteFileBytes(JoinPath(dir, entry.file_name), bytes, error)) {
      return false;
    }
    entry.size_bytes = bytes.size();
    out->segments.push_back(std::move(entry));
  }
  return true;
}

namespace {

SegmentationResult Fail(const SegmentRequest& request, StagedDirectory* staged,
                        const std::string& detail) {
  if (staged != nullptr) {
    staged->Abandon();
  } else {
    StagedDirectory(request.output_dir).Abandon();
  }
  std::ostringstream oss;
  oss << "[BitstreamSegmenter] SEGMENTATION_FAILURE identity=" << request.identity
      << " container=" << request.container_path << " reason=" << detail;
  Logger::Error(oss.str());
  return SegmentationResult::Failure(detail);
}

}  // namespace

SegmentationResult BitstreamSegmenter::Segment(const SegmentRequest& request) {
  if (request.output_dir.empty()) {
    return SegmentationResult::Failure("output directory not set");
  }
  if (!request.gof_plan.IsValid()) {
    return Fail(request, nullptr, "invalid GoF plan");
  }

  SampleStream stream;
  auto parsed = bitstream::ReadSampleStreamFile(request.container_path, &stream);
  if (!parsed.ok) {
    return Fail(request, nullptr, "unparsable container: " + parsed.error);
  }

  DemuxedContainer demuxed;
  auto demux = ContainerDemuxer::Demux(stream, request.split_components, &demuxed);
  if (!demux.ok) {
    return Fail(request, nullptr, "unrecognizable unit sequence: " + demux.error);
  }
  if (demuxed.packed_video_downgrade) {
    Logger::Warn("[BitstreamSegmenter] PACKED_VIDEO_COMBINED identity=" + request.identity +
                 " split requested but container carries packed video");
  }
  if (demuxed.streams.empty() || demuxed.streams.front().init_units.empty()) {
    return Fail(request, nullptr, "container holds no parameter set units");
  }

  const size_t gof_count = demuxed.gof_count;
  if (request.expected_frames > 0) {
    const int64_t expected_gofs = request.gof_plan.ExpectedGofs(request.expected_frames);
    if (expected_gofs != static_cast<int64_t>(gof_count)) {
      std::ostringstream oss;
      oss << "frame-count mismatch: container has " << gof_count << " GoFs, "
          << request.expected_frames << " frames at encoder-gof "
          << request.gof_plan.encoder_gof << " need " << expected_gofs;
      return Fail(request, nullptr, oss.str());
    }
  }

  const auto gof_frames = GofFrameCounts(gof_count, request.gof_plan, request.expected_frames);
  const auto windows = PlanSegmentWindows(gof_frames, request.gof_plan);

  SegmentIndex index;
  index.project = request.project;
  index.identity = request.identity;
  index.tile_id = request.tile_id;
  index.quality = request.quality;
  index.gof_plan = request.gof_plan;
  index.frame_rate = request.frame_rate;
  index.layout = demuxed.layout;
  index.total_gofs = static_cast<uint32_t>(gof_count);
  for (uint32_t f : gof_frames) index.total_frames += f;
  index.tile_bounds = request.tile_bounds;

  StagedDirectory staged(request.output_dir);
  std::string error;
  if (!staged.Prepare(&error)) {
    return Fail(request, &staged, error);
  }

  for (const auto& component : demuxed.streams) {
    ComponentIndex entry;
    const std::string dir = JoinPath(staged.staging_path(), ComponentDirName(component.kind));
    if (!WriteComponentSegments(dir, component.kind, component.init_units, component.gofs,
                                windows, &entry, &error)) {
      return Fail(request, &staged, error);
    }
    index.components.push_back(std::move(entry));
  }

  if (!WriteSegmentIndexFile(JoinPath(staged.staging_path(), kIndexFileName), index,
                             &error)) {
    return Fail(request, &staged, error);
  }
  if (!staged.Publish(&error)) {
    return Fail(request, &staged, error);
  }

  std::ostringstream oss;
  oss << "[BitstreamSegmenter] SEGMENTED identity=" << request.identity
      << " layout=" << ContainerLayoutToString(index.layout)
      << " components=" << index.components.size() << " gofs=" << gof_count
      << " segments=" << windows.size() << " frames=" << index.total_frames;
  Logger::Info(oss.str());
  return SegmentationResult::Success(std::move(index));
}

}  // namespace v3cdash::segment
