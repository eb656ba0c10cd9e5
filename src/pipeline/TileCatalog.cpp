// Repository: V3CDash
// Component: Tile Catalog Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/pipeline/TileCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

#include <google/protobuf/struct.pb.h>

#include "v3cdash/util/Logger.hpp"
#include "v3cdash/util/ProtoJson.hpp"

namespace fs = std::filesystem;

namespace v3cdash::pipeline {

using util::Logger;

namespace {

constexpr const char* kFrameSuffix = ".ply";
constexpr const char* kTileDirPrefix = "tile_";

bool ParseDigits(const std::string& s, int64_t* out) {
  if (s.empty() || s.size() > 18) return false;
  int64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  *out = v;
  return true;
}

struct FrameName {
  std::string prefix;
  size_t width = 0;
  int64_t number = 0;
};

// "<prefix><digits>.ply"
bool SplitFrameName(const std::string& name, FrameName* out) {
  const std::string suffix = kFrameSuffix;
  if (name.size() <= suffix.size() ||
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return false;
  }
  const std::string stem = name.substr(0, name.size() - suffix.size());
  size_t digits_begin = stem.size();
  while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(stem[digits_begin - 1]))) {
    --digits_begin;
  }
  if (digits_begin == stem.size()) return false;
  out->prefix = stem.substr(0, digits_begin);
  out->width = stem.size() - digits_begin;
  return ParseDigits(stem.substr(digits_begin), &out->number);
}

double NumberField(const google::protobuf::Struct& s, const std::string& key, bool* ok) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || !it->second.has_number_value()) {
    *ok = false;
    return 0.0;
  }
  return it->second.number_value();
}

}  // namespace

CatalogResult TileCatalog::DescribeFrames(const std::vector<std::string>& file_names,
                                          FrameSequence* out) {
  std::vector<FrameName> frames;
  for (const auto& name : file_names) {
    FrameName f;
    if (SplitFrameName(name, &f)) frames.push_back(f);
  }
  if (frames.empty()) {
    return CatalogResult::Failure("no numbered .ply frames");
  }
  std::sort(frames.begin(), frames.end(),
            [](const FrameName& a, const FrameName& b) { return a.number < b.number; });

  const FrameName& first = frames.front();
  for (size_t i = 0; i < frames.size(); ++i) {
    const FrameName& f = frames[i];
    if (f.prefix != first.prefix || f.width != first.width) {
      return CatalogResult::Failure("mixed frame naming: '" + first.prefix + "' vs '" +
                                    f.prefix + "'");
    }
    if (f.number != first.number + static_cast<int64_t>(i)) {
      std::ostringstream oss;
      oss << "frame numbers are not contiguous: expected " << (first.number + i)
          << ", found " << f.number;
      return CatalogResult::Failure(oss.str());
    }
  }

  std::ostringstream pattern;
  pattern << first.prefix << "%0" << first.width << "d" << kFrameSuffix;
  out->pattern = pattern.str();
  out->start_frame = first.number;
  out->frame_count = static_cast<int64_t>(frames.size());

  std::string digits = std::to_string(first.number);
  if (digits.size() < first.width) digits.insert(0, first.width - digits.size(), '0');
  out->first_file = first.prefix + digits + kFrameSuffix;
  return CatalogResult::Success();
}

CatalogResult TileCatalog::LoadBoundaries(
    const std::string& path, std::map<int32_t, std::vector<SegmentBounds>>* by_tile) {
  google::protobuf::Struct root;
  std::string error;
  if (!util::ReadMessageJsonFile(path, &root, &error)) {
    return CatalogResult::Failure(error);
  }

  by_tile->clear();
  for (const auto& [key, value] : root.fields()) {
    int64_t segment_index = 0;
    if (!ParseDigits(key, &segment_index) || segment_index <= 0) {
      return CatalogResult::Failure(path + ": segment key '" + key + "' is not a positive index");
    }
    if (!value.has_list_value()) {
      return CatalogResult::Failure(path + ": segment " + key + " is not a list");
    }
    for (const auto& item : value.list_value().values()) {
      if (!item.has_struct_value()) {
        return CatalogResult::Failure(path + ": segment " + key + " holds a non-object");
      }
      const auto& s = item.struct_value();
      bool ok = true;
      SegmentBounds sb;
      sb.segment_index = static_cast<uint32_t>(segment_index);
      const int32_t tile_id = static_cast<int32_t>(NumberField(s, "id", &ok));
      sb.bounds.x_min = NumberField(s, "xmin", &ok);
      sb.bounds.x_max = NumberField(s, "xmax", &ok);
      sb.bounds.y_min = NumberField(s, "ymin", &ok);
      sb.bounds.y_max = NumberField(s, "ymax", &ok);
      sb.bounds.z_min = NumberField(s, "zmin", &ok);
      sb.bounds.z_max = NumberField(s, "zmax", &ok);
      if (!ok) {
        return CatalogResult::Failure(path + ": segment " + key + " has an incomplete entry");
      }
      (*by_tile)[tile_id].push_back(sb);
    }
  }
  for (auto& [tile_id, bounds] : *by_tile) {
    std::sort(bounds.begin(), bounds.end(), [](const SegmentBounds& a, const SegmentBounds& b) {
      return a.segment_index < b.segment_index;
    });
  }
  return CatalogResult::Success();
}

std::optional<int> TileCatalog::InferVox(const std::string& frame_name) {
  size_t pos = 0;
  while ((pos = frame_name.find("vox", pos)) != std::string::npos) {
    size_t end = pos + 3;
    while (end < frame_name.size() && std::isdigit(static_cast<unsigned char>(frame_name[end]))) {
      ++end;
    }
    int64_t value = 0;
    if (end > pos + 3 && ParseDigits(frame_name.substr(pos + 3, end - pos - 3), &value) &&
        value > 0 && value < 64) {
      return static_cast<int>(value);
    }
    pos += 3;
  }
  return std::nullopt;
}

CatalogResult TileCatalog::Discover(const std::string& project_dir, std::vector<Tile>* tiles) {
  tiles->clear();
  std::error_code ec;
  if (!fs::is_directory(project_dir, ec)) {
    return CatalogResult::Failure("tiles directory not found: " + project_dir);
  }

  const std::string prefix = kTileDirPrefix;
  for (fs::directory_iterator it(project_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec)) continue;
    const std::string name = it->path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    int64_t id = 0;
    if (!ParseDigits(name.substr(prefix.size()), &id)) continue;

    std::vector<std::string> files;
    std::error_code file_ec;
    for (fs::directory_iterator f(it->path(), file_ec), fend; !file_ec && f != fend;
         f.increment(file_ec)) {
      if (f->is_regular_file(entry_ec)) files.push_back(f->path().filename().string());
    }
    if (file_ec) {
      return CatalogResult::Failure("cannot list " + it->path().string() + ": " +
                                    file_ec.message());
    }

    FrameSequence seq;
    auto described = DescribeFrames(files, &seq);
    if (!described.ok) {
      return CatalogResult::Failure(name + ": " + described.error);
    }
    Tile tile;
    tile.id = static_cast<int32_t>(id);
    tile.directory = it->path().string();
    tile.frame_pattern = seq.pattern;
    tile.start_frame = seq.start_frame;
    tile.frame_count = seq.frame_count;
    tiles->push_back(std::move(tile));
  }
  if (ec) {
    return CatalogResult::Failure("cannot list " + project_dir + ": " + ec.message());
  }
  if (tiles->empty()) {
    return CatalogResult::Failure("no tile_<id> directories under " + project_dir);
  }
  std::sort(tiles->begin(), tiles->end(),
            [](const Tile& a, const Tile& b) { return a.id < b.id; });

  const std::string boundaries = (fs::path(project_dir) / kTileBoundariesFileName).string();
  if (fs::exists(boundaries, ec)) {
    std::map<int32_t, std::vector<SegmentBounds>> by_tile;
    auto loaded = LoadBoundaries(boundaries, &by_tile);
    if (!loaded.ok) {
      Logger::Warn("[TileCatalog] BOUNDARIES_IGNORED " + loaded.error);
    } else {
      for (auto& tile : *tiles) {
        auto found = by_tile.find(tile.id);
        if (found != by_tile.end()) tile.spatial_bounds = found->second;
      }
    }
  }

  std::ostringstream oss;
  oss << "[TileCatalog] DISCOVERED tiles=" << tiles->size() << " dir=" << project_dir;
  Logger::Info(oss.str());
  return CatalogResult::Success();
}

}  // namespace v3cdash::pipeline
