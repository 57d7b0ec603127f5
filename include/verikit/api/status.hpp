#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "verikit/api/export.hpp"

namespace verikit {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kAlreadyInitialized,
  kNotFound,
  kWouldBlock,
  kTimeout,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kJson = 0x20,
  kConfig = 0x30,
  kGraph = 0x40,
  kExec = 0x50,
  kSched = 0x60,
  kReport = 0x70,
};

// Module-local detail ids. Every id used here has an entry in the catalog.
namespace detail {
static const std::uint32_t kNone = 0x0000;

static const std::uint32_t kConfigInvalidOption = 0x0001;
static const std::uint32_t kConfigUnknownTask = 0x0002;
static const std::uint32_t kConfigCatalogMalformed = 0x0003;

static const std::uint32_t kGraphUnknownDependency = 0x0001;
static const std::uint32_t kGraphCycleDetected = 0x0002;
static const std::uint32_t kGraphUnknownTask = 0x0003;
static const std::uint32_t kGraphDuplicateTask = 0x0004;

static const std::uint32_t kExecVerifierFailed = 0x0001;
static const std::uint32_t kExecTimeout = 0x0002;
static const std::uint32_t kExecSpawnFailed = 0x0003;

static const std::uint32_t kSchedAggregationInconsistency = 0x0001;
static const std::uint32_t kSchedSubmitRejected = 0x0002;

static const std::uint32_t kReportWriteFailed = 0x0001;

static const std::uint32_t kJsonParseFailed = 0x0001;
static const std::uint32_t kJsonWriteFailed = 0x0002;
}  // namespace detail

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
VERIKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                        std::uint32_t detail_id = 0);
VERIKIT_API const char* ErrorModuleName(ErrorModule module);
VERIKIT_API const char* StatusCodeName(StatusCode status_code);
VERIKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
VERIKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  ErrorModule module() const { return static_cast<ErrorModule>((hex_code_ >> 24) & 0xFFu); }
  std::uint32_t detail_id() const { return hex_code_ & 0x000FFFFFu; }
  bool Is(ErrorModule module, std::uint32_t detail_id) const {
    return !ok() && this->module() == module && this->detail_id() == detail_id;
  }

  // "<SYMBOL> (0x........): message", falls back to the status name when the
  // code is not catalogued.
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), has_value_(false), value_() {}
  Result(const T& value) : status_(Status::Ok()), has_value_(true), value_(value) {}
  Result(T&& value) : status_(Status::Ok()), has_value_(true), value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  bool has_value() const { return has_value_; }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  bool has_value_;
  T value_;
};

}  // namespace api
}  // namespace verikit
