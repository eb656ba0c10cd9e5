// Repository: V3CDash
// Component: Pipeline Types Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/core/PipelineTypes.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace v3cdash {

const char* PipelineErrorToString(PipelineError error) {
  switch (error) {
    case PipelineError::kNone:
      return "NONE";
    case PipelineError::kConfigInvariantViolation:
      return "CONFIG_INVARIANT_VIOLATION";
    case PipelineError::kEncodeJobFailure:
      return "ENCODE_JOB_FAILURE";
    case PipelineError::kSegmentationFailure:
      return "SEGMENTATION_FAILURE";
    case PipelineError::kMultiplexMismatch:
      return "MULTIPLEX_MISMATCH";
    case PipelineError::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN_ERROR";
}

const char* PipelineStageToString(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::kEncode:
      return "ENCODE";
    case PipelineStage::kSegment:
      return "SEGMENT";
    case PipelineStage::kMultiplex:
      return "MULTIPLEX";
  }
  return "UNKNOWN";
}

// =============================================================================
// ThreadBudget
// =============================================================================

ThreadBudget ThreadBudget::Resolve(int parallelism,
                                   std::optional<int> requested_threads_per_instance) {
  ThreadBudget budget;
  budget.parallelism = std::max(1, parallelism);
  int threads = requested_threads_per_instance.value_or(1);
  budget.threads_per_instance = std::clamp(threads, 1, budget.parallelism);
  return budget;
}

int ThreadBudget::MaxConcurrentEncodes() const {
  if (threads_per_instance <= 0) return 1;
  return std::max(1, parallelism / threads_per_instance);
}

// =============================================================================
// QualityTriplet
// =============================================================================

namespace {

// Optional sign followed by at least one digit, nothing else.
bool IsDecimal(const std::string& s) {
  size_t i = 0;
  if (!s.empty() && (s[0] == '-' || s[0] == '+')) i = 1;
  if (i >= s.size()) return false;
  for (size_t k = i; k < s.size(); ++k) {
    if (s[k] < '0' || s[k] > '9') return false;
  }
  return true;
}

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

}  // namespace

bool ParseInteger(const std::string& text, int* out) {
  if (!IsDecimal(text)) return false;
  try {
    *out = std::stoi(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

bool ParseInteger(const std::string& text, int64_t* out) {
  if (!IsDecimal(text)) return false;
  try {
    *out = static_cast<int64_t>(std::stoll(text));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

bool ParseQualityTriplets(const std::string& text,
                          std::vector<QualityTriplet>* out,
                          std::string* error) {
  out->clear();
  std::stringstream groups(text);
  std::string item;
  while (std::getline(groups, item, ',')) {
    item = Trim(item);
    if (item.empty()) continue;

    std::vector<std::string> parts;
    std::stringstream fields(item);
    std::string field;
    while (std::getline(fields, field, ':')) {
      parts.push_back(Trim(field));
    }
    if (parts.size() != 3) {
      *error = "invalid qp group '" + item + "', expected occ:geo:attr";
      return false;
    }
    QualityTriplet q;
    if (!ParseInteger(parts[0], &q.occ) || !ParseInteger(parts[1], &q.geo) ||
        !ParseInteger(parts[2], &q.attr)) {
      *error = "invalid qp group '" + item + "', values must be integers";
      return false;
    }
    out->push_back(q);
  }
  if (out->empty()) {
    *error = "qp triplets cannot be empty";
    return false;
  }
  return true;
}

std::string FormatQualityTriplet(const QualityTriplet& q) {
  std::ostringstream oss;
  oss << "occ" << q.occ << "/geo" << q.geo << "/attr" << q.attr;
  return oss.str();
}

// =============================================================================
// Components
// =============================================================================

const char* ComponentDirName(ComponentKind kind) {
  switch (kind) {
    case ComponentKind::kAtlas:
      return "atlas";
    case ComponentKind::kOccupancy:
      return "occp";
    case ComponentKind::kGeometry:
      return "geom";
    case ComponentKind::kAttribute:
      return "attr";
    case ComponentKind::kCombined:
      return "combined";
  }
  return "unknown";
}

std::optional<ComponentKind> ComponentFromDirName(const std::string& name) {
  if (name == "atlas") return ComponentKind::kAtlas;
  if (name == "occp") return ComponentKind::kOccupancy;
  if (name == "geom") return ComponentKind::kGeometry;
  if (name == "attr") return ComponentKind::kAttribute;
  if (name == "combined") return ComponentKind::kCombined;
  return std::nullopt;
}

const char* ContainerLayoutToString(ContainerLayout layout) {
  switch (layout) {
    case ContainerLayout::kSplit:
      return "SPLIT";
    case ContainerLayout::kCombined:
      return "COMBINED";
  }
  return "UNKNOWN";
}

std::optional<ContainerLayout> ContainerLayoutFromString(const std::string& s) {
  if (s == "SPLIT") return ContainerLayout::kSplit;
  if (s == "COMBINED") return ContainerLayout::kCombined;
  return std::nullopt;
}

// =============================================================================
// BitstreamIdentity
// =============================================================================

std::string BitstreamIdentity::Name() const {
  std::ostringstream oss;
  oss << project << "_tile_" << tile_id << "_occ" << quality.occ << "_geo"
      << quality.geo << "_attr" << quality.attr;
  return oss.str();
}

}  // namespace v3cdash
