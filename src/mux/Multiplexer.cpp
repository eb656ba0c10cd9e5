// Repository: V3CDash
// Component: Multiplexer Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/mux/Multiplexer.hpp"

#include <filesystem>
#include <set>
#include <sstream>
#include <system_error>
#include <vector>

#include "v3cdash/bitstream/ContainerDemuxer.hpp"
#include "v3cdash/bitstream/V3cSampleStream.hpp"
#include "v3cdash/segment/BitstreamSegmenter.hpp"
#include "v3cdash/segment/SegmentLayout.hpp"
#include "v3cdash/util/Logger.hpp"

namespace fs = std::filesystem;

namespace v3cdash::mux {

using bitstream::SampleStream;
using bitstream::V3cUnit;
using segment::ComponentIndex;
using segment::SegmentEntry;
using segment::SegmentIndex;
using util::Logger;

namespace {

// One component's units, regrouped per GoF across all its segments.
struct LoadedComponent {
  const ComponentIndex* index = nullptr;
  std::vector<V3cUnit> init_units;
  std::vector<std::vector<V3cUnit>> gofs;
};

bool IsMandatory(ComponentKind kind) {
  return kind == ComponentKind::kAtlas || kind == ComponentKind::kOccupancy ||
         kind == ComponentKind::kGeometry;
}

bool LoadComponent(const std::string& dir, const ComponentIndex& index, LoadedComponent* out,
                   std::string* error) {
  const std::string name = ComponentDirName(index.component);
  out->index = &index;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    *error = "component " + name + " listed in index but directory is missing";
    return false;
  }

  bool has_init = false;
  std::set<uint32_t> found;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string file = it->path().filename().string();
    if (file == segment::kInitFileName) {
      has_init = true;
      continue;
    }
    auto seg = segment::ParseSegmentFileName(file);
    if (seg.has_value()) found.insert(*seg);
  }
  if (ec) {
    *error = "cannot list " + dir + ": " + ec.message();
    return false;
  }
  if (!has_init) {
    *error = "component " + name + " has no " + segment::kInitFileName;
    return false;
  }
  const uint32_t count = static_cast<uint32_t>(found.size());
  if (count == 0 || *found.rbegin() != count) {
    std::ostringstream oss;
    oss << "component " << name << " segments are not contiguous from 1 ("
        << count << " files, highest index " << (count == 0 ? 0 : *found.rbegin()) << ")";
    *error = oss.str();
    return false;
  }
  if (count != index.segments.size()) {
    std::ostringstream oss;
    oss << "component " << name << " has " << count << " segment files, index lists "
        << index.segments.size();
    *error = oss.str();
    return false;
  }

  SampleStream init;
  auto parsed = bitstream::ReadSampleStreamFile(segment::JoinPath(dir, segment::kInitFileName),
                                                &init);
  if (!parsed.ok) {
    *error = "component " + name + " init: " + parsed.error;
    return false;
  }
  out->init_units = std::move(init.units);

  for (uint32_t i = 0; i < count; ++i) {
    const SegmentEntry& entry = index.segments[i];
    if (entry.index != i + 1) {
      std::ostringstream oss;
      oss << "component " << name << " index entry " << i << " has segment index "
          << entry.index;
      *error = oss.str();
      return false;
    }
    if (entry.gof_count != entry.gof_unit_counts.size()) {
      std::ostringstream oss;
      oss << "component " << name << " segment " << entry.index << " records "
          << entry.gof_count << " GoFs but " << entry.gof_unit_counts.size() << " unit counts";
      *error = oss.str();
      return false;
    }

    SampleStream stream;
    auto seg_parsed = bitstream::ReadSampleStreamFile(
        segment::JoinPath(dir, segment::SegmentFileName(entry.index)), &stream);
    if (!seg_parsed.ok) {
      std::ostringstream oss;
      oss << "component " << name << " segment " << entry.index << ": " << seg_parsed.error;
      *error = oss.str();
      return false;
    }
    if (stream.units.size() != entry.UnitCount()) {
      std::ostringstream oss;
      oss << "component " << name << " segment " << entry.index << " holds "
          << stream.units.size() << " units, index records " << entry.UnitCount();
      *error = oss.str();
      return false;
    }

    size_t pos = 0;
    for (uint32_t units_in_gof : entry.gof_unit_counts) {
      std::vector<V3cUnit> gof(stream.units.begin() + pos,
                               stream.units.begin() + pos + units_in_gof);
      pos += units_in_gof;
      out->gofs.push_back(std::move(gof));
    }
  }
  return true;
}

// Absolute, normalized, without a trailing separator.
fs::path ResolvedRoot(const std::string& root, std::error_code* ec) {
  fs::path p = fs::weakly_canonical(root, *ec);
  if (*ec) return {};
  p = p.lexically_normal();
  if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
  return p;
}

// True when inner equals outer or lies below it, compared by path element.
bool IsWithin(const fs::path& inner, const fs::path& outer) {
  auto in = inner.begin();
  for (auto out = outer.begin(); out != outer.end(); ++out, ++in) {
    if (in == inner.end() || *in != *out) return false;
  }
  return true;
}

MultiplexResult Fail(const MultiplexRequest& request, segment::StagedDirectory* staged,
                     const std::string& detail) {
  if (staged != nullptr) staged->Abandon();
  std::ostringstream oss;
  oss << "[Multiplexer] MULTIPLEX_MISMATCH input=" << request.input_root
      << " reason=" << detail;
  Logger::Error(oss.str());
  return MultiplexResult::Failure(detail);
}

}  // namespace

MultiplexResult Multiplexer::Multiplex(const MultiplexRequest& request) {
  if (request.input_root.empty() || request.output_root.empty()) {
    return Fail(request, nullptr, "input and output roots must be set");
  }
  std::error_code in_ec;
  std::error_code out_ec;
  const fs::path input = ResolvedRoot(request.input_root, &in_ec);
  const fs::path output = ResolvedRoot(request.output_root, &out_ec);
  if (in_ec || out_ec) {
    return Fail(request, nullptr,
                "cannot resolve roots: " + (in_ec ? in_ec : out_ec).message());
  }
  // Publishing replaces the output tree wholesale.
  if (IsWithin(output, input) || IsWithin(input, output)) {
    return Fail(request, nullptr, "output root must not overlap input root");
  }

  segment::StagedDirectory staged(request.output_root);
  std::error_code ec;
  SegmentIndex split;
  std::string error;
  if (!segment::ReadSegmentIndexFile(
          segment::JoinPath(request.input_root, segment::kIndexFileName), &split, &error)) {
    return Fail(request, &staged, "unreadable segment index: " + error);
  }
  if (split.layout != ContainerLayout::kSplit) {
    return Fail(request, &staged, "segment index describes a combined layout");
  }

  // Index and directories must list the same components.
  for (ComponentKind kind : kSplitComponentOrder) {
    const bool listed = split.FindComponent(kind) != nullptr;
    const bool on_disk =
        fs::is_directory(segment::JoinPath(request.input_root, ComponentDirName(kind)), ec);
    if (!listed && IsMandatory(kind)) {
      return Fail(request, &staged,
                  std::string("mandatory component ") + ComponentDirName(kind) + " missing");
    }
    if (!listed && on_disk) {
      return Fail(request, &staged,
                  std::string("component directory ") + ComponentDirName(kind) +
                      " is not listed in the index");
    }
  }
  if (split.FindComponent(ComponentKind::kCombined) != nullptr) {
    return Fail(request, &staged, "split index lists a combined component");
  }

  std::vector<LoadedComponent> loaded;
  for (ComponentKind kind : kSplitComponentOrder) {
    const ComponentIndex* component = split.FindComponent(kind);
    if (component == nullptr) continue;
    LoadedComponent lc;
    if (!LoadComponent(segment::JoinPath(request.input_root, ComponentDirName(kind)),
                       *component, &lc, &error)) {
      return Fail(request, &staged, error);
    }
    loaded.push_back(std::move(lc));
  }

  // Cross-component agreement, against atlas as reference.
  const ComponentIndex& reference = *loaded.front().index;
  for (const auto& lc : loaded) {
    const ComponentIndex& c = *lc.index;
    if (c.segments.size() != reference.segments.size()) {
      std::ostringstream oss;
      oss << "segment count mismatch: " << ComponentDirName(reference.component) << "="
          << reference.segments.size() << " " << ComponentDirName(c.component) << "="
          << c.segments.size();
      return Fail(request, &staged, oss.str());
    }
    for (size_t i = 0; i < c.segments.size(); ++i) {
      if (c.segments[i].frame_count != reference.segments[i].frame_count ||
          c.segments[i].gof_count != reference.segments[i].gof_count) {
        std::ostringstream oss;
        oss << "segment " << (i + 1) << " disagrees between "
            << ComponentDirName(reference.component) << " and "
            << ComponentDirName(c.component) << " (frames " << reference.segments[i].frame_count
            << " vs " << c.segments[i].frame_count << ", gofs "
            << reference.segments[i].gof_count << " vs " << c.segments[i].gof_count << ")";
        return Fail(request, &staged, oss.str());
      }
    }
  }

  // Interleave.
  std::vector<V3cUnit> init_units;
  for (const auto& lc : loaded) {
    for (const auto& unit : lc.init_units) bitstream::AppendUnique(&init_units, unit);
  }
  const size_t gof_count = loaded.front().gofs.size();
  std::vector<std::vector<V3cUnit>> gofs(gof_count);
  for (size_t g = 0; g < gof_count; ++g) {
    for (const auto& lc : loaded) {
      gofs[g].insert(gofs[g].end(), lc.gofs[g].begin(), lc.gofs[g].end());
    }
  }

  std::vector<segment::SegmentWindow> windows;
  uint32_t first_gof = 0;
  for (const auto& entry : reference.segments) {
    segment::SegmentWindow window;
    window.index = entry.index;
    window.first_gof = first_gof;
    window.gof_count = entry.gof_count;
    window.first_frame = entry.first_frame;
    window.frame_count = entry.frame_count;
    first_gof += entry.gof_count;
    windows.push_back(window);
  }

  SegmentIndex combined = split;
  combined.layout = ContainerLayout::kCombined;
  combined.components.clear();

  if (!staged.Prepare(&error)) {
    return Fail(request, &staged, error);
  }
  ComponentIndex combined_component;
  if (!segment::WriteComponentSegments(
          segment::JoinPath(staged.staging_path(), ComponentDirName(ComponentKind::kCombined)),
          ComponentKind::kCombined, init_units, gofs, windows, &combined_component, &error)) {
    return Fail(request, &staged, error);
  }
  combined.components.push_back(std::move(combined_component));
  if (!segment::WriteSegmentIndexFile(
          segment::JoinPath(staged.staging_path(), segment::kIndexFileName), combined, &error)) {
    return Fail(request, &staged, error);
  }
  if (!staged.Publish(&error)) {
    return Fail(request, &staged, error);
  }

  std::ostringstream oss;
  oss << "[Multiplexer] MULTIPLEXED identity=" << combined.identity
      << " components=" << loaded.size() << " segments=" << windows.size()
      << " output=" << request.output_root;
  Logger::Info(oss.str());
  return MultiplexResult::Success(std::move(combined));
}

}  // namespace v3cdash::mux
