#include "verikit/report/json_summary_reporter.hpp"

#include <ctime>

#include <glog/logging.h>

#include "verikit/api/version.hpp"

namespace verikit {
namespace report {

namespace {

std::string FormatUtc(const task::WallTime& at) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(at);
  std::tm tm_utc;
  if (seconds <= 0 || gmtime_r(&seconds, &tm_utc) == NULL) return std::string();
  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == 0) {
    return std::string();
  }
  return buffer;
}

json::Json TaskToJson(const task::TaskSummary& entry) {
  json::Json out = {
      {"id", entry.name},
      {"status", task::TaskStatusName(entry.status)},
      {"duration_seconds", entry.duration_seconds},
      {"dependencies", entry.dependencies},
      {"requested", entry.requested},
      {"launched", entry.launched},
  };
  if (entry.launched) {
    out["exit_code"] = entry.exit_code;
    out["log_path"] = entry.log_path;
    out["attempts"] = entry.attempts;
  }
  if (!entry.note.empty()) out["note"] = entry.note;
  if (!entry.message.empty()) out["message"] = entry.message;
  return out;
}

}  // namespace

const char* JsonSummaryReporter::Name() const { return "verikit.report.json_summary"; }

std::uint32_t JsonSummaryReporter::ApiVersion() const { return api::kApiVersion; }

void JsonSummaryReporter::Release() { delete this; }

json::Json JsonSummaryReporter::ToJson(const task::SessionSummary& summary) {
  json::Json tasks = json::Json::array();
  for (std::size_t i = 0; i < summary.tasks.size(); ++i) {
    tasks.push_back(TaskToJson(summary.tasks[i]));
  }

  json::Json counts = {
      {"total", summary.counts.total},
      {"succeeded", summary.counts.succeeded},
      {"failed", summary.counts.failed},
      {"timed_out", summary.counts.timed_out},
      {"propagated", summary.counts.propagated},
  };

  return json::Json{
      {"version", api::kVersionString},
      {"requested", summary.requested},
      {"overall_status", task::OverallStatusName(summary.overall)},
      {"exit_code", task::ExitCodeFor(summary.overall)},
      {"counts", counts},
      {"total_duration_seconds", summary.total_duration_seconds},
      {"started_at", FormatUtc(summary.started_at)},
      {"finished_at", FormatUtc(summary.finished_at)},
      {"max_concurrency", summary.max_concurrency},
      {"task_timeout_seconds", summary.task_timeout_seconds},
      {"fail_fast", summary.fail_fast},
      {"fail_fast_triggered", summary.fail_fast_triggered},
      {"tasks", tasks},
  };
}

api::Status JsonSummaryReporter::Report(const task::SessionSummary& summary) {
  if (path_.empty()) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "summary path is empty",
                                   api::ErrorModule::kReport);
  }
  const json::Json document = ToJson(summary);
  VLOG(2) << "summary: " << json::JsonCodec::Dump(document);
  api::Status st = json::JsonCodec::SaveFile(path_, document);
  if (!st.ok()) {
    LOG(ERROR) << "writing summary failed: " << st.ToString();
    return api::Status::FromModule(api::StatusCode::kIoError, st.message(),
                                   api::ErrorModule::kReport, api::detail::kReportWriteFailed);
  }
  LOG(INFO) << "summary written to " << path_;
  return api::Status::Ok();
}

}  // namespace report
}  // namespace verikit
