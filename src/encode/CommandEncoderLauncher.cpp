// Repository: V3CDash
// Component: Command Encoder Launcher Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/encode/CommandEncoderLauncher.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "v3cdash/bitstream/V3cSampleStream.hpp"
#include "v3cdash/encode/ExternalProcess.hpp"
#include "v3cdash/util/Logger.hpp"

namespace fs = std::filesystem;

namespace v3cdash::encode {

using util::Logger;

std::string ExpandPlaceholders(const std::string& text,
                               const std::map<std::string, std::string>& values) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t open = text.find('{', pos);
    if (open == std::string::npos) break;
    const size_t close = text.find('}', open + 1);
    if (close == std::string::npos) break;
    out.append(text, pos, open - pos);
    auto it = values.find(text.substr(open + 1, close - open - 1));
    if (it != values.end()) {
      out += it->second;
    } else {
      out.append(text, open, close - open + 1);
    }
    pos = close + 1;
  }
  out.append(text, pos, std::string::npos);
  return out;
}

CommandEncoderLauncher::CommandEncoderLauncher(EncoderCommandConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> CommandEncoderLauncher::BuildArguments(
    const EncodeJob& job, const std::string& output_path) const {
  const std::map<std::string, std::string> values = {
      {"tile_dir", job.tile.directory},
      {"frame_pattern", job.tile.frame_pattern},
      {"start_frame", std::to_string(job.tile.start_frame)},
      {"frame_count", std::to_string(job.tile.frame_count)},
      {"output", output_path},
      {"occ", std::to_string(job.identity.quality.occ)},
      {"geo", std::to_string(job.identity.quality.geo)},
      {"attr", std::to_string(job.identity.quality.attr)},
      {"threads", std::to_string(job.threads_per_instance)},
      {"gof", std::to_string(job.encoder_gof)},
      {"vox", std::to_string(job.vox)},
      {"tile_id", std::to_string(job.identity.tile_id)},
      {"identity", job.Name()},
  };
  std::vector<std::string> args;
  args.reserve(config_.args.size() + config_.extra_args.size());
  for (const auto& arg : config_.args) args.push_back(ExpandPlaceholders(arg, values));
  for (const auto& arg : config_.extra_args) args.push_back(ExpandPlaceholders(arg, values));
  return args;
}

namespace {

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    Logger::Warn("[CommandEncoderLauncher] REMOVE_FAILED path=" + path + " " + ec.message());
  }
}

bool EnsureParent(const std::string& path, std::string* error) {
  const fs::path parent = fs::path(path).parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    *error = "cannot create " + parent.string() + ": " + ec.message();
    return false;
  }
  return true;
}

void WriteLogHeader(const std::string& log_path, const std::string& identity,
                    const std::string& program, const std::vector<std::string>& args) {
  if (log_path.empty()) return;
  std::ofstream log(log_path, std::ios::app);
  if (!log) return;
  log << "# encode " << identity << "\n# " << program;
  for (const auto& arg : args) log << ' ' << arg;
  log << "\n";
}

}  // namespace

EncodeOutcome CommandEncoderLauncher::Encode(const EncodeJob& job,
                                             const std::atomic<bool>& cancel) {
  const std::string part_path = PartialPathFor(job.output_path);
  auto fail = [&](EncodeOutcome outcome) {
    RemoveQuietly(part_path);
    RemoveQuietly(job.output_path);
    return outcome;
  };

  std::string error;
  if (!EnsureParent(job.output_path, &error)) return fail(EncodeOutcome::Failed(error));
  if (!job.log_path.empty() && !EnsureParent(job.log_path, &error)) {
    return fail(EncodeOutcome::Failed(error));
  }
  // Stale results of an earlier run never survive a new attempt.
  RemoveQuietly(part_path);
  RemoveQuietly(job.output_path);

  ProcessSpec spec;
  spec.program = config_.program;
  spec.args = BuildArguments(job, part_path);
  spec.log_path = job.log_path;
  spec.working_dir = config_.working_dir;
  WriteLogHeader(job.log_path, job.Name(), spec.program, spec.args);

  {
    std::ostringstream oss;
    oss << "[CommandEncoderLauncher] ENCODE_START identity=" << job.Name()
        << " frames=" << job.tile.frame_count << " threads=" << job.threads_per_instance
        << " log=" << job.log_path;
    Logger::Info(oss.str());
  }

  const ProcessResult result = ExternalProcess::Run(spec, cancel, config_.grace_period);
  if (result.status == ProcessResult::Status::kCancelled) {
    return fail(EncodeOutcome::Cancelled("encode cancelled"));
  }
  if (!result.Succeeded()) {
    return fail(EncodeOutcome::Failed("encoder " + result.Describe() + " (log " +
                                      job.log_path + ")"));
  }

  std::error_code ec;
  const auto size = fs::file_size(part_path, ec);
  if (ec || size == 0) {
    return fail(EncodeOutcome::Failed("encoder exited 0 but produced an empty container"));
  }
  bitstream::SampleStream stream;
  auto parsed = bitstream::ReadSampleStreamFile(part_path, &stream);
  if (!parsed.ok) {
    return fail(EncodeOutcome::Failed("corrupt container: " + parsed.error));
  }

  fs::rename(part_path, job.output_path, ec);
  if (ec) {
    return fail(EncodeOutcome::Failed("cannot publish container: " + ec.message()));
  }

  std::ostringstream oss;
  oss << "[CommandEncoderLauncher] ENCODE_DONE identity=" << job.Name() << " bytes=" << size
      << " units=" << stream.units.size() << " output=" << job.output_path;
  Logger::Info(oss.str());
  return EncodeOutcome::Succeeded(job.output_path);
}

}  // namespace v3cdash::encode
