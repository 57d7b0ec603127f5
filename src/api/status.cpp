#include "verikit/api/status.hpp"

#include <cstdio>

namespace verikit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define VK_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    {VK_ECODE(ErrorModule::kCore, StatusCode::kOk, detail::kNone), "CORE_OK",
     "Operation succeeded"},
    {VK_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, detail::kNone),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {VK_ECODE(ErrorModule::kCore, StatusCode::kNotFound, detail::kNone), "CORE_NOT_FOUND",
     "Resource not found"},
    {VK_ECODE(ErrorModule::kCore, StatusCode::kIoError, detail::kNone), "CORE_IO_ERROR",
     "I/O error"},
    {VK_ECODE(ErrorModule::kCore, StatusCode::kInternalError, detail::kNone),
     "CORE_INTERNAL_ERROR", "Internal error"},

    {VK_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument, detail::kConfigInvalidOption),
     "CONFIG_INVALID_OPTION", "Invalid configuration option value"},
    {VK_ECODE(ErrorModule::kConfig, StatusCode::kNotFound, detail::kConfigUnknownTask),
     "CONFIG_UNKNOWN_TASK", "Requested task is not declared"},
    {VK_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument,
              detail::kConfigCatalogMalformed),
     "CONFIG_CATALOG_MALFORMED", "Task catalog has an invalid structure"},

    {VK_ECODE(ErrorModule::kGraph, StatusCode::kNotFound, detail::kGraphUnknownDependency),
     "GRAPH_UNKNOWN_DEPENDENCY", "Dependency refers to an undeclared task"},
    {VK_ECODE(ErrorModule::kGraph, StatusCode::kInvalidArgument, detail::kGraphCycleDetected),
     "GRAPH_CYCLE_DETECTED", "Dependency relation contains a cycle"},
    {VK_ECODE(ErrorModule::kGraph, StatusCode::kNotFound, detail::kGraphUnknownTask),
     "GRAPH_UNKNOWN_TASK", "Task name is not declared"},
    {VK_ECODE(ErrorModule::kGraph, StatusCode::kInvalidArgument, detail::kGraphDuplicateTask),
     "GRAPH_DUPLICATE_TASK", "Task name declared more than once"},

    {VK_ECODE(ErrorModule::kExec, StatusCode::kInternalError, detail::kExecVerifierFailed),
     "EXEC_VERIFIER_FAILED", "Verifier returned a nonzero exit status"},
    {VK_ECODE(ErrorModule::kExec, StatusCode::kTimeout, detail::kExecTimeout), "EXEC_TIMEOUT",
     "Verifier exceeded the task timeout"},
    {VK_ECODE(ErrorModule::kExec, StatusCode::kIoError, detail::kExecSpawnFailed),
     "EXEC_SPAWN_FAILED", "Verifier process could not be started"},

    {VK_ECODE(ErrorModule::kSched, StatusCode::kInternalError,
              detail::kSchedAggregationInconsistency),
     "SCHED_AGGREGATION_INCONSISTENCY", "Scheduler invariant violated"},
    {VK_ECODE(ErrorModule::kSched, StatusCode::kWouldBlock, detail::kSchedSubmitRejected),
     "SCHED_SUBMIT_REJECTED", "Worker pool rejected a task"},

    {VK_ECODE(ErrorModule::kReport, StatusCode::kIoError, detail::kReportWriteFailed),
     "REPORT_WRITE_FAILED", "Session summary could not be written"},

    {VK_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, detail::kJsonParseFailed),
     "JSON_PARSE_FAILED", "JSON parse failed"},
    {VK_ECODE(ErrorModule::kJson, StatusCode::kIoError, detail::kJsonWriteFailed),
     "JSON_WRITE_FAILED", "JSON write failed"},
};

#undef VK_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kJson:
      return "json";
    case ErrorModule::kConfig:
      return "config";
    case ErrorModule::kGraph:
      return "graph";
    case ErrorModule::kExec:
      return "exec";
    case ErrorModule::kSched:
      return "sched";
    case ErrorModule::kReport:
      return "report";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotInitialized:
      return "kNotInitialized";
    case StatusCode::kAlreadyInitialized:
      return "kAlreadyInitialized";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kTimeout:
      return "kTimeout";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  const ErrorCatalogEntry* entry = FindErrorCatalogEntry(hex_code_);
  std::string out = entry != NULL ? entry->symbol : StatusCodeName(code_);
  out += " (";
  out += FormatErrorCodeHex(hex_code_);
  out += ")";
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace verikit
