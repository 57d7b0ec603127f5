#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/config/task_catalog.hpp"
#include "verikit/task/i_verifier.hpp"

namespace verikit {
namespace verifier {

struct ProcessVerifierOptions {
  config::InvocationTable invocations;
  std::string log_dir = "logs";  // one <task>.log per invocation
  std::string workdir;           // empty -> inherit
  std::uint32_t kill_grace_ms = 1000;  // SIGTERM -> SIGKILL
  std::uint32_t poll_interval_ms = 50;
};

// Runs each task as an external process in its own process group, with
// stdout and stderr captured to the task log. Cancellation or deadline expiry
// sends SIGTERM to the group, then SIGKILL after kill_grace_ms, and reports
// terminated with exit code 124.
class VERIKIT_API ProcessVerifier : public task::IVerifier {
 public:
  explicit ProcessVerifier(const ProcessVerifierOptions& options) : options_(options) {}
  ~ProcessVerifier() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;

  api::Result<task::VerifierResult> Execute(const task::VerifierRequest& request,
                                            const task::CancellationToken* cancel) override;

  // argv for the request: invocation program, substituted args, then the
  // task's extra args. EXEC_SPAWN_FAILED when the kind has no invocation or
  // a placeholder has no value.
  api::Result<std::vector<std::string> > BuildCommand(const task::VerifierRequest& request) const;

  std::string LogPathFor(const std::string& task_id) const;

  const ProcessVerifierOptions& options() const { return options_; }

 private:
  ProcessVerifierOptions options_;
};

}  // namespace verifier
}  // namespace verikit
