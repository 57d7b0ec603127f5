#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"

namespace verikit {
namespace config {

// Settings of one verikit_run invocation. Config file values are applied
// first, command-line values override them.
struct RunConfig {
  std::string target = "all";
  std::size_t parallel = 0;  // 0 -> hardware concurrency
  std::uint32_t timeout_seconds = 0;
  std::uint32_t grace_period_ms = 2000;
  std::uint32_t max_retries = 0;  // extra attempts after a Failed outcome
  bool fail_fast = false;
  std::string catalog_path;  // empty -> built-in catalog
  std::string summary_path = "verikit-summary.json";
  std::string log_dir = "logs";
  std::string log_config;
  std::string workdir;
  bool verbose = false;

  // Command line only.
  std::string config_path;
  bool dry_run = false;
  bool list = false;
  bool show_help = false;
  bool show_version = false;
};

// Applies "key = value" lines onto *config. Unknown keys are ignored; a
// malformed value is CONFIG_INVALID_OPTION naming the line.
VERIKIT_API api::Status ParseRunConfig(std::istream& input, RunConfig* config);

VERIKIT_API api::Status LoadRunConfigFile(const std::string& path, RunConfig* config);

// Applies argv[1..argc) onto *config. -c/--config is recorded but not loaded.
VERIKIT_API api::Status ParseCommandLine(int argc, const char* const* argv, RunConfig* config);

// Defaults, then the file named by -c/--config, then the command line.
VERIKIT_API api::Status BuildRunConfig(int argc, const char* const* argv, RunConfig* config);

VERIKIT_API api::Status ValidateRunConfig(const RunConfig& config);

VERIKIT_API std::string UsageText(const std::string& program);

}  // namespace config
}  // namespace verikit
