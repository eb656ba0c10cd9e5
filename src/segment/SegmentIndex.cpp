// Repository: V3CDash
// Component: Segment Index Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/segment/SegmentIndex.hpp"

#include <numeric>

#include "segment_index_v1.pb.h"
#include "v3cdash/util/ProtoJson.hpp"

namespace v3cdash::segment {

namespace pb = ::v3cdash::index::v1;

uint32_t SegmentEntry::UnitCount() const {
  return std::accumulate(gof_unit_counts.begin(), gof_unit_counts.end(), 0u);
}

const ComponentIndex* SegmentIndex::FindComponent(ComponentKind kind) const {
  for (const auto& c : components) {
    if (c.component == kind) return &c;
  }
  return nullptr;
}

void ToProto(const SegmentIndex& index, pb::SegmentIndex* out) {
  out->Clear();
  out->set_schema_version(index.schema_version);
  out->set_project(index.project);
  out->set_identity(index.identity);
  out->set_tile_id(index.tile_id);

  auto* quality = out->mutable_quality();
  quality->set_occupancy_qp(index.quality.occ);
  quality->set_geometry_qp(index.quality.geo);
  quality->set_attribute_qp(index.quality.attr);

  auto* plan = out->mutable_gof_plan();
  plan->set_segment_size(index.gof_plan.segment_size);
  plan->set_encoder_gof(index.gof_plan.encoder_gof);
  plan->set_gofs_per_segment(index.gof_plan.GofsPerSegment());

  out->set_frame_rate(index.frame_rate);
  out->set_layout(ContainerLayoutToString(index.layout));
  out->set_total_frames(index.total_frames);
  out->set_total_gofs(index.total_gofs);

  for (const auto& component : index.components) {
    auto* c = out->add_components();
    c->set_component(ComponentDirName(component.component));
    c->set_init_file(component.init_file);
    c->set_init_size_bytes(component.init_size_bytes);
    c->set_init_unit_count(component.init_unit_count);
    for (const auto& segment : component.segments) {
      auto* s = c->add_segments();
      s->set_index(segment.index);
      s->set_file_name(segment.file_name);
      s->set_size_bytes(segment.size_bytes);
      s->set_frame_count(segment.frame_count);
      s->set_first_frame(segment.first_frame);
      s->set_gof_count(segment.gof_count);
      for (uint32_t count : segment.gof_unit_counts) s->add_gof_unit_counts(count);
    }
  }

  for (const auto& sb : index.tile_bounds) {
    auto* b = out->add_tile_bounds();
    b->set_segment_index(sb.segment_index);
    auto* bounds = b->mutable_bounds();
    bounds->set_x_min(sb.bounds.x_min);
    bounds->set_x_max(sb.bounds.x_max);
    bounds->set_y_min(sb.bounds.y_min);
    bounds->set_y_max(sb.bounds.y_max);
    bounds->set_z_min(sb.bounds.z_min);
    bounds->set_z_max(sb.bounds.z_max);
  }
}

bool FromProto(const pb::SegmentIndex& in, SegmentIndex* out, std::string* error) {
  *out = SegmentIndex{};
  out->schema_version = in.schema_version();
  out->project = in.project();
  out->identity = in.identity();
  out->tile_id = in.tile_id();
  out->quality = QualityTriplet{in.quality().occupancy_qp(), in.quality().geometry_qp(),
                                in.quality().attribute_qp()};
  out->gof_plan.segment_size = in.gof_plan().segment_size();
  out->gof_plan.encoder_gof = in.gof_plan().encoder_gof();
  if (!out->gof_plan.IsValid()) {
    *error = "invalid gof_plan in index";
    return false;
  }
  out->frame_rate = in.frame_rate();

  auto layout = ContainerLayoutFromString(in.layout());
  if (!layout.has_value()) {
    *error = "unknown layout '" + in.layout() + "'";
    return false;
  }
  out->layout = *layout;
  out->total_frames = in.total_frames();
  out->total_gofs = in.total_gofs();

  for (const auto& c : in.components()) {
    auto kind = ComponentFromDirName(c.component());
    if (!kind.has_value()) {
      *error = "unknown component '" + c.component() + "'";
      return false;
    }
    ComponentIndex component;
    component.component = *kind;
    component.init_file = c.init_file();
    component.init_size_bytes = c.init_size_bytes();
    component.init_unit_count = c.init_unit_count();
    for (const auto& s : c.segments()) {
      SegmentEntry entry;
      entry.index = s.index();
      entry.file_name = s.file_name();
      entry.size_bytes = s.size_bytes();
      entry.frame_count = s.frame_count();
      entry.first_frame = s.first_frame();
      entry.gof_count = s.gof_count();
      entry.gof_unit_counts.assign(s.gof_unit_counts().begin(), s.gof_unit_counts().end());
      component.segments.push_back(std::move(entry));
    }
    out->components.push_back(std::move(component));
  }

  for (const auto& b : in.tile_bounds()) {
    SegmentBounds sb;
    sb.segment_index = b.segment_index();
    sb.bounds.x_min = b.bounds().x_min();
    sb.bounds.x_max = b.bounds().x_max();
    sb.bounds.y_min = b.bounds().y_min();
    sb.bounds.y_max = b.bounds().y_max();
    sb.bounds.z_min = b.bounds().z_min();
    sb.bounds.z_max = b.bounds().z_max();
    out->tile_bounds.push_back(sb);
  }
  return true;
}

bool WriteSegmentIndexFile(const std::string& path, const SegmentIndex& index,
                           std::string* error) {
  pb::SegmentIndex message;
  ToProto(index, &message);
  return util::WriteMessageJsonFile(path, message, error);
}

bool ReadSegmentIndexFile(const std::string& path, SegmentIndex* index, std::string* error) {
  pb::SegmentIndex message;
  if (!util::ReadMessageJsonFile(path, &message, error)) return false;
  if (!FromProto(message, index, error)) {
    *error = path + ": " + *error;
    return false;
  }
  return true;
}

}  // namespace v3cdash::segment
