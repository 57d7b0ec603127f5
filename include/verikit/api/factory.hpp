#pragma once

#include <cstdint>

#include "verikit/api/export.hpp"

namespace verikit {
namespace log {
class ILogManager;
}
namespace report {
class IReporter;
}
}  // namespace verikit

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
VERIKIT_API std::uint32_t verikit_get_api_version();

// Create a log manager instance owned by the caller.
VERIKIT_API verikit::log::ILogManager* verikit_create_log_manager();

// Destroy a log manager created by verikit_create_log_manager.
VERIKIT_API void verikit_destroy_log_manager(verikit::log::ILogManager* manager);

// Create a reporter that writes the session summary as JSON to `path`.
// Returns NULL when path is NULL or empty.
VERIKIT_API verikit::report::IReporter* verikit_create_json_summary_reporter(const char* path);

// Destroy a reporter created by verikit_create_json_summary_reporter.
VERIKIT_API void verikit_destroy_reporter(verikit::report::IReporter* reporter);

}
