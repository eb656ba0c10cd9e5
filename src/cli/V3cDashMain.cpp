// Repository: V3CDash
// Component: v3cdash command line
// Purpose: Entry points for a full run, standalone segmentation of one
//          container, and standalone multiplexing of one split identity.
// Copyright (c) 2025 V3CDash Contributors
//
// MODES OF OPERATION:
// 1. run      encode every (tile, quality) pair, segment, optionally multiplex
// 2. segment  segment one existing container
// 3. mux      recombine one split identity directory

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "v3cdash/core/PipelineConfig.hpp"
#include "v3cdash/mux/Multiplexer.hpp"
#include "v3cdash/pipeline/PipelineRunner.hpp"
#include "v3cdash/segment/BitstreamSegmenter.hpp"
#include "v3cdash/segment/SegmentLayout.hpp"
#include "v3cdash/util/Logger.hpp"

namespace {

using v3cdash::PipelineConfig;
using v3cdash::util::Logger;
namespace pipeline = v3cdash::pipeline;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
enum class Mode { kRun, kSegment, kMux };

struct CliArgs {
  Mode mode = Mode::kRun;
  PipelineConfig config;
  bool encoder_args_replaced = false;

  // segment mode
  std::string input_path;
  std::string output_root;

  // mux mode
  std::string input_root;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [run|segment|mux] [OPTIONS]\n"
            << "\n"
            << "Encodes point-cloud tiles at several quality levels and cuts the\n"
            << "resulting V3C bitstreams into DASH-ready segments.\n"
            << "\n"
            << "RUN (default):\n"
            << "  --project NAME          Project name (default: default_project)\n"
            << "  --tiles-root DIR        Tiles input root (default: output/tiles)\n"
            << "  --encoded-root DIR      Encoded container root (default: output/encoded)\n"
            << "  --segmented-root DIR    Segment tree root (default: output/v3c)\n"
            << "  --combined-root DIR     Multiplexed tree root (default: output/v3c_combined)\n"
            << "  --logs-dir DIR          Run log root (default: output/logs)\n"
            << "  --qp LIST               Quality triplets occ:geo:attr,... (default: 24:32:43)\n"
            << "  --segment-size N        Frames per segment (default: 16)\n"
            << "  --encoder-gof N         Frames per encoder GoF (default: 16)\n"
            << "  --frame-rate R          Frames per second (default: 30)\n"
            << "  --parallelism N         Total CPU threads (default: 1)\n"
            << "  --threads-per-instance N  Threads per encoder (default: 1)\n"
            << "  --frame-count N         Override every tile's frame count\n"
            << "  --start-frame N         Override every tile's start frame\n"
            << "  --vox N                 Geometry bit depth (default: from frame names)\n"
            << "  --encoder PROGRAM       Encoder executable (default: PccAppEncoder)\n"
            << "  --encoder-arg ARG       Replace the encoder argument template (repeatable)\n"
            << "  --encoder-extra-arg ARG Append to the encoder arguments (repeatable)\n"
            << "  --no-split              Keep components interleaved (combined layout)\n"
            << "  --multiplex             Also write a combined tree from split output\n"
            << "  --skip-encoding         Segment containers already on disk\n"
            << "  --skip-segmentation     Encode only\n"
            << "\n"
            << "SEGMENT:\n"
            << "  --input FILE.bin        Container to segment\n"
            << "  --output-root DIR       Tree is written to DIR/<file stem>/\n"
            << "  --frame-count N         Expected frames (default: unchecked)\n"
            << "  --segment-size, --encoder-gof, --frame-rate, --project, --no-split\n"
            << "\n"
            << "MUX:\n"
            << "  --input-root DIR        Split identity directory\n"
            << "  --output-root DIR       Combined identity directory\n"
            << "\n"
            << "EXIT CODES: 0 complete, 1 degraded, 2 fatal, 130 cancelled\n"
            << "\n";
}

bool ParseDouble(const std::string& text, double* out) {
  try {
    size_t used = 0;
    const double v = std::stod(text, &used);
    if (used != text.size()) return false;
    *out = v;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  int i = 1;
  if (i < argc) {
    const std::string first = argv[i];
    if (first == "run") {
      ++i;
    } else if (first == "segment") {
      args.mode = Mode::kSegment;
      ++i;
    } else if (first == "mux") {
      args.mode = Mode::kMux;
      ++i;
    }
  }

  PipelineConfig& c = args.config;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    // Values outside the target type's range are rejected, not wrapped.
    auto int_value = [&](auto* out) -> bool {
      if (!has_value || !v3cdash::ParseInteger(argv[i + 1], out)) {
        args.error = arg + " requires an integer in range";
        return false;
      }
      ++i;
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--project" && has_value) {
      c.project_name = argv[++i];
    } else if (arg == "--tiles-root" && has_value) {
      c.tiles_root = argv[++i];
    } else if (arg == "--encoded-root" && has_value) {
      c.encoded_root = argv[++i];
    } else if (arg == "--segmented-root" && has_value) {
      c.segmented_root = argv[++i];
    } else if (arg == "--combined-root" && has_value) {
      c.combined_root = argv[++i];
    } else if (arg == "--logs-dir" && has_value) {
      c.logs_dir = argv[++i];
    } else if (arg == "--qp" && has_value) {
      std::string error;
      if (!v3cdash::ParseQualityTriplets(argv[++i], &c.triplets, &error)) {
        args.error = "--qp: " + error;
        return args;
      }
    } else if (arg == "--segment-size") {
      if (!int_value(&c.gof_plan.segment_size)) return args;
    } else if (arg == "--encoder-gof") {
      if (!int_value(&c.gof_plan.encoder_gof)) return args;
    } else if (arg == "--frame-rate") {
      if (!has_value || !ParseDouble(argv[i + 1], &c.frame_rate)) {
        args.error = "--frame-rate requires a number";
        return args;
      }
      ++i;
    } else if (arg == "--parallelism") {
      if (!int_value(&c.parallelism)) return args;
    } else if (arg == "--threads-per-instance") {
      int threads = 0;
      if (!int_value(&threads)) return args;
      c.threads_per_instance = threads;
    } else if (arg == "--frame-count") {
      int64_t frames = 0;
      if (!int_value(&frames)) return args;
      c.frame_count_override = frames;
    } else if (arg == "--start-frame") {
      int64_t start = 0;
      if (!int_value(&start)) return args;
      c.start_frame_override = start;
    } else if (arg == "--vox") {
      int vox = 0;
      if (!int_value(&vox)) return args;
      c.vox = vox;
    } else if (arg == "--encoder" && has_value) {
      c.encoder.program = argv[++i];
    } else if (arg == "--encoder-arg" && has_value) {
      if (!args.encoder_args_replaced) {
        c.encoder.args.clear();
        args.encoder_args_replaced = true;
      }
      c.encoder.args.push_back(argv[++i]);
    } else if (arg == "--encoder-extra-arg" && has_value) {
      c.encoder.extra_args.push_back(argv[++i]);
    } else if (arg == "--no-split") {
      c.split_components = false;
    } else if (arg == "--multiplex") {
      c.multiplex = true;
    } else if (arg == "--skip-encoding") {
      c.skip_encoding = true;
    } else if (arg == "--skip-segmentation") {
      c.skip_segmentation = true;
    } else if (arg == "--input" && has_value) {
      args.input_path = argv[++i];
    } else if (arg == "--input-root" && has_value) {
      args.input_root = argv[++i];
    } else if (arg == "--output-root" && has_value) {
      args.output_root = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.mode == Mode::kSegment && (args.input_path.empty() || args.output_root.empty())) {
    args.error = "segment requires --input and --output-root";
    return args;
  }
  if (args.mode == Mode::kMux && (args.input_root.empty() || args.output_root.empty())) {
    args.error = "mux requires --input-root and --output-root";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Modes
// =============================================================================

int RunPipeline(const PipelineConfig& config) {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  pipeline::PipelineRunner runner(config);

  std::atomic<bool> done{false};
  std::thread watcher([&]() {
    bool forwarded = false;
    while (!done.load(std::memory_order_acquire)) {
      if (!forwarded && g_termination_requested.load(std::memory_order_acquire)) {
        Logger::Warn("[CLI] SIGNAL_RECEIVED action=cancel");
        runner.Cancel();
        forwarded = true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  pipeline::RunSummary summary = runner.Run();
  done.store(true, std::memory_order_release);
  watcher.join();

  if (summary.fatal) {
    std::cerr << "Error: " << summary.fatal_detail << "\n";
  } else {
    std::cout << "identities=" << summary.identities << " published=" << summary.published
              << " failed=" << summary.failed << "\n";
    if (!summary.report_path.empty()) std::cout << "report: " << summary.report_path << "\n";
    std::cout << "logs: " << summary.run_log_dir << "\n";
  }
  return summary.ExitCode();
}

int RunSegment(const CliArgs& args) {
  const PipelineConfig& c = args.config;
  auto plan = v3cdash::ConfigValidator::ValidateGofPlan(c.gof_plan);
  if (!plan.valid) {
    std::cerr << "Error: " << plan.detail << "\n";
    return pipeline::kExitFatal;
  }
  if (c.frame_rate <= 0.0) {
    std::cerr << "Error: --frame-rate must be positive\n";
    return pipeline::kExitFatal;
  }

  const std::string stem = std::filesystem::path(args.input_path).stem().string();
  v3cdash::segment::SegmentRequest request;
  request.container_path = args.input_path;
  request.output_dir = v3cdash::segment::JoinPath(args.output_root, stem);
  request.project = c.project_name;
  request.identity = stem;
  request.gof_plan = c.gof_plan;
  request.frame_rate = c.frame_rate;
  request.expected_frames = c.frame_count_override.value_or(0);
  request.split_components = c.split_components;

  auto result = v3cdash::segment::BitstreamSegmenter::Segment(request);
  if (!result.ok) {
    std::cerr << "Error: " << result.detail << "\n";
    return pipeline::kExitDegraded;
  }
  std::cout << "segmented " << request.output_dir << "\n";
  return pipeline::kExitOk;
}

int RunMux(const CliArgs& args) {
  v3cdash::mux::MultiplexRequest request;
  request.input_root = args.input_root;
  request.output_root = args.output_root;
  auto result = v3cdash::mux::Multiplexer::Multiplex(request);
  if (!result.ok) {
    std::cerr << "Error: " << result.detail << "\n";
    return pipeline::kExitDegraded;
  }
  std::cout << "multiplexed " << request.output_root << "\n";
  return pipeline::kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return pipeline::kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return pipeline::kExitFatal;
  }

  switch (args.mode) {
    case Mode::kSegment:
      return RunSegment(args);
    case Mode::kMux:
      return RunMux(args);
    case Mode::kRun:
      break;
  }
  return RunPipeline(args.config);
}
