// Repository: V3CDash
// Component: Command Encoder Launcher
// Purpose: Runs the configured external V-PCC encoder command for one job,
//          writing to <output>.part and publishing only a container that
//          parses as a V3C sample stream.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_ENCODE_COMMAND_ENCODER_LAUNCHER_HPP_
#define V3CDASH_ENCODE_COMMAND_ENCODER_LAUNCHER_HPP_

#include <map>
#include <string>
#include <vector>

#include "v3cdash/core/PipelineConfig.hpp"
#include "v3cdash/encode/IEncoderLauncher.hpp"

namespace v3cdash::encode {

// Replaces every {name} with values[name]. Unknown names are kept verbatim.
std::string ExpandPlaceholders(const std::string& text,
                               const std::map<std::string, std::string>& values);

class CommandEncoderLauncher : public IEncoderLauncher {
 public:
  explicit CommandEncoderLauncher(EncoderCommandConfig config);
  ~CommandEncoderLauncher() override = default;

  EncodeOutcome Encode(const EncodeJob& job, const std::atomic<bool>& cancel) override;

  // Expanded argv[1..] for job, writing to output_path.
  std::vector<std::string> BuildArguments(const EncodeJob& job,
                                          const std::string& output_path) const;

  static std::string PartialPathFor(const std::string& output_path) {
    return output_path + ".part";
  }

 private:
  EncoderCommandConfig config_;
};

}  // namespace v3cdash::encode

#endif  // V3CDASH_ENCODE_COMMAND_ENCODER_LAUNCHER_HPP_
