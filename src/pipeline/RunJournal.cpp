// Repository: V3CDash
// Component: Run Journal Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/pipeline/RunJournal.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "segment_index_v1.pb.h"
#include "v3cdash/util/Logger.hpp"
#include "v3cdash/util/ProtoJson.hpp"

namespace fs = std::filesystem;

namespace v3cdash::pipeline {

namespace pb = ::v3cdash::index::v1;
using util::Logger;

namespace {

void ToProto(const IdentityOutcome& in, pb::IdentityOutcome* out) {
  out->set_identity(in.identity.Name());
  out->set_tile_id(in.identity.tile_id);
  out->mutable_quality()->set_occupancy_qp(in.identity.quality.occ);
  out->mutable_quality()->set_geometry_qp(in.identity.quality.geo);
  out->mutable_quality()->set_attribute_qp(in.identity.quality.attr);
  out->set_stage(PipelineStageToString(in.stage));
  out->set_ok(in.ok);
  out->set_error(PipelineErrorToString(in.error));
  out->set_detail(in.detail);
}

bool StageFromString(const std::string& s, PipelineStage* out) {
  for (PipelineStage stage :
       {PipelineStage::kEncode, PipelineStage::kSegment, PipelineStage::kMultiplex}) {
    if (s == PipelineStageToString(stage)) {
      *out = stage;
      return true;
    }
  }
  return false;
}

bool ErrorFromString(const std::string& s, PipelineError* out) {
  for (PipelineError error :
       {PipelineError::kNone, PipelineError::kConfigInvariantViolation,
        PipelineError::kEncodeJobFailure, PipelineError::kSegmentationFailure,
        PipelineError::kMultiplexMismatch, PipelineError::kCancelled}) {
    if (s == PipelineErrorToString(error)) {
      *out = error;
      return true;
    }
  }
  return false;
}

// Project prefix of "<project>_tile_<id>_occ.." given the tile id.
std::string ProjectFromIdentity(const std::string& identity, int32_t tile_id) {
  const std::string marker = "_tile_" + std::to_string(tile_id) + "_";
  const size_t pos = identity.rfind(marker);
  return pos == std::string::npos ? std::string() : identity.substr(0, pos);
}

}  // namespace

std::string IdentityOutcome::ToJsonLine() const {
  pb::IdentityOutcome message;
  ToProto(*this, &message);
  std::string json;
  std::string error;
  if (!util::MessageToJsonLine(message, &json, &error)) {
    Logger::Error("[RunJournal] ENCODE_FAILED " + error);
    return "{}";
  }
  return json;
}

bool IdentityOutcome::FromJsonLine(const std::string& line, IdentityOutcome& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}') return false;
  pb::IdentityOutcome message;
  std::string error;
  if (!util::JsonToMessage(line, &message, &error)) return false;
  if (message.identity().empty()) return false;

  IdentityOutcome parsed;
  parsed.identity.tile_id = message.tile_id();
  parsed.identity.project = ProjectFromIdentity(message.identity(), message.tile_id());
  parsed.identity.quality = QualityTriplet{message.quality().occupancy_qp(),
                                           message.quality().geometry_qp(),
                                           message.quality().attribute_qp()};
  if (!StageFromString(message.stage(), &parsed.stage)) return false;
  if (!ErrorFromString(message.error(), &parsed.error)) return false;
  parsed.ok = message.ok();
  parsed.detail = message.detail();
  out = std::move(parsed);
  return true;
}

RunJournal::RunJournal(const std::string& dir, std::string project, GofPlan gof_plan,
                       ThreadBudget budget)
    : project_(std::move(project)), gof_plan_(gof_plan), budget_(budget) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create journal directory " + dir + ": " + ec.message());
  }
  journal_path_ = (fs::path(dir) / kJournalFileName).string();
  journal_.open(journal_path_, std::ios::app);
  if (!journal_.is_open()) {
    throw std::runtime_error("cannot open journal " + journal_path_);
  }
}

RunJournal::~RunJournal() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (journal_.is_open()) journal_.close();
}

void RunJournal::Record(const IdentityOutcome& outcome) {
  const std::string line = outcome.ToJsonLine();
  const std::string name = outcome.identity.Name();
  std::lock_guard<std::mutex> lock(mutex_);
  if (latest_.find(name) == latest_.end()) order_.push_back(name);
  latest_[name] = outcome;
  journal_ << line << '\n';
  journal_.flush();
  if (!journal_) {
    Logger::Warn("[RunJournal] APPEND_FAILED path=" + journal_path_);
    journal_.clear();
  }
}

void RunJournal::MarkCancelled() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
}

bool RunJournal::Cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::vector<IdentityOutcome> RunJournal::Outcomes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<IdentityOutcome> out;
  out.reserve(order_.size());
  for (const auto& name : order_) out.push_back(latest_.at(name));
  return out;
}

std::vector<std::string> RunJournal::PublishedIdentities() const {
  std::vector<std::string> out;
  for (const auto& o : Outcomes()) {
    if (o.ok) out.push_back(o.identity.Name());
  }
  return out;
}

std::vector<std::string> RunJournal::FailedIdentities() const {
  std::vector<std::string> out;
  for (const auto& o : Outcomes()) {
    if (!o.ok) out.push_back(o.identity.Name());
  }
  return out;
}

bool RunJournal::Degraded() const { return !FailedIdentities().empty(); }

bool RunJournal::WriteReport(const std::string& path, std::string* error) const {
  pb::RunReport report;
  report.set_schema_version(1);
  report.set_project(project_);
  report.mutable_gof_plan()->set_segment_size(gof_plan_.segment_size);
  report.mutable_gof_plan()->set_encoder_gof(gof_plan_.encoder_gof);
  report.mutable_gof_plan()->set_gofs_per_segment(gof_plan_.GofsPerSegment());
  report.mutable_budget()->set_parallelism(budget_.parallelism);
  report.mutable_budget()->set_threads_per_instance(budget_.threads_per_instance);
  report.mutable_budget()->set_max_concurrent_encodes(budget_.MaxConcurrentEncodes());
  report.set_degraded(Degraded());
  report.set_cancelled(Cancelled());
  for (const auto& o : Outcomes()) ToProto(o, report.add_outcomes());
  for (const auto& name : PublishedIdentities()) report.add_published_identities(name);
  for (const auto& name : FailedIdentities()) report.add_failed_identities(name);

  std::error_code ec;
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);
  if (ec) {
    *error = "cannot create " + parent.string() + ": " + ec.message();
    return false;
  }
  return util::WriteMessageJsonFile(path, report, error);
}

std::vector<IdentityOutcome> RunJournal::Replay(const std::string& journal_path) {
  std::vector<IdentityOutcome> out;
  std::ifstream in(journal_path);
  std::string line;
  while (std::getline(in, line)) {
    IdentityOutcome outcome;
    if (!IdentityOutcome::FromJsonLine(line, outcome)) continue;
    out.push_back(std::move(outcome));
  }
  return out;
}

}  // namespace v3cdash::pipeline
