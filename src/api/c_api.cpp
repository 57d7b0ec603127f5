#include "verikit/api/factory.hpp"

#include "log/log_manager_adapter.hpp"
#include "verikit/api/version.hpp"
#include "verikit/report/json_summary_reporter.hpp"

extern "C" {

std::uint32_t verikit_get_api_version() { return verikit::api::kApiVersion; }

verikit::log::ILogManager* verikit_create_log_manager() {
  return new verikit::log::LogManagerAdapter();
}

void verikit_destroy_log_manager(verikit::log::ILogManager* manager) {
  delete manager;
}

verikit::report::IReporter* verikit_create_json_summary_reporter(const char* path) {
  if (path == NULL || path[0] == '\0') {
    return NULL;
  }
  return new verikit::report::JsonSummaryReporter(path);
}

void verikit_destroy_reporter(verikit::report::IReporter* reporter) { delete reporter; }

}
