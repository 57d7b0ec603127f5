#pragma once

#include <string>

#include "verikit/api/export.hpp"
#include "verikit/json/json_codec.hpp"
#include "verikit/report/i_reporter.hpp"

namespace verikit {
namespace report {

// Persists the session summary as one JSON document.
class VERIKIT_API JsonSummaryReporter : public IReporter {
 public:
  explicit JsonSummaryReporter(const std::string& path) : path_(path) {}
  ~JsonSummaryReporter() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Status Report(const task::SessionSummary& summary) override;

  const std::string& path() const { return path_; }

  static json::Json ToJson(const task::SessionSummary& summary);

 private:
  std::string path_;
};

}  // namespace report
}  // namespace verikit
