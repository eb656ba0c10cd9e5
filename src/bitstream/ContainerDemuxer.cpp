// Repository: V3CDash
// Component: Container Demuxer Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/bitstream/ContainerDemuxer.hpp"

#include <array>
#include <sstream>

namespace v3cdash::bitstream {

std::optional<ComponentKind> ComponentForUnit(V3cUnitType type) {
  switch (type) {
    case V3cUnitType::kAd:
      return ComponentKind::kAtlas;
    case V3cUnitType::kOvd:
      return ComponentKind::kOccupancy;
    case V3cUnitType::kGvd:
      return ComponentKind::kGeometry;
    case V3cUnitType::kAvd:
      return ComponentKind::kAttribute;
    case V3cUnitType::kVps:
    case V3cUnitType::kCad:
    case V3cUnitType::kPvd:
      return std::nullopt;
  }
  return std::nullopt;
}

void AppendUnique(std::vector<V3cUnit>* units, const V3cUnit& unit) {
  for (const auto& existing : *units) {
    if (existing.bytes == unit.bytes) return;
  }
  units->push_back(unit);
}

namespace {

size_t SplitSlot(ComponentKind kind) {
  for (size_t i = 0; i < kSplitComponentOrder.size(); ++i) {
    if (kSplitComponentOrder[i] == kind) return i;
  }
  return 0;
}

}  // namespace

DemuxResult ContainerDemuxer::Demux(const SampleStream& stream, bool split_components,
                                    DemuxedContainer* out) {
  *out = DemuxedContainer{};

  std::vector<V3cUnit> parameter_units;
  std::vector<std::vector<V3cUnit>> gofs;
  bool has_packed_video = false;

  for (size_t i = 0; i < stream.units.size(); ++i) {
    const V3cUnit& unit = stream.units[i];
    if (IsParameterUnit(unit.type)) {
      AppendUnique(&parameter_units, unit);
      continue;
    }
    if (unit.type == V3cUnitType::kAd) {
      gofs.emplace_back();
    } else if (gofs.empty()) {
      std::ostringstream oss;
      oss << V3cUnitTypeToString(unit.type) << " unit #" << i
          << " precedes the first atlas data unit";
      return DemuxResult::Failure(oss.str());
    }
    if (unit.type == V3cUnitType::kPvd) has_packed_video = true;
    gofs.back().push_back(unit);
  }

  if (gofs.empty()) {
    return DemuxResult::Failure("container holds no atlas data units");
  }

  out->gof_count = gofs.size();
  if (split_components && !has_packed_video) {
    out->layout = ContainerLayout::kSplit;
  } else {
    out->layout = ContainerLayout::kCombined;
    out->packed_video_downgrade = split_components && has_packed_video;
  }

  if (out->layout == ContainerLayout::kCombined) {
    ComponentStream combined;
    combined.kind = ComponentKind::kCombined;
    combined.init_units = std::move(parameter_units);
    combined.gofs = std::move(gofs);
    out->streams.push_back(std::move(combined));
    return DemuxResult::Success();
  }

  // Split: bucket every GoF by component.
  std::array<ComponentStream, 4> buckets;
  std::array<size_t, 4> gofs_with_units{};
  for (size_t slot = 0; slot < buckets.size(); ++slot) {
    buckets[slot].kind = kSplitComponentOrder[slot];
    buckets[slot].init_units = parameter_units;
    buckets[slot].gofs.resize(gofs.size());
  }
  for (size_t g = 0; g < gofs.size(); ++g) {
    for (auto& unit : gofs[g]) {
      auto kind = ComponentForUnit(unit.type);
      if (!kind.has_value()) continue;
      buckets[SplitSlot(*kind)].gofs[g].push_back(std::move(unit));
    }
    for (size_t slot = 0; slot < buckets.size(); ++slot) {
      if (!buckets[slot].gofs[g].empty()) ++gofs_with_units[slot];
    }
  }

  for (size_t slot = 0; slot < buckets.size(); ++slot) {
    if (gofs_with_units[slot] == 0) continue;
    if (gofs_with_units[slot] != gofs.size()) {
      std::ostringstream oss;
      oss << "component " << ComponentDirName(buckets[slot].kind) << " present in "
          << gofs_with_units[slot] << " of " << gofs.size() << " GoFs";
      out->streams.clear();
      return DemuxResult::Failure(oss.str());
    }
    out->streams.push_back(std::move(buckets[slot]));
  }
  return DemuxResult::Success();
}

}  // namespace v3cdash::bitstream
