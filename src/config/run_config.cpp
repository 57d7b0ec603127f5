#include "verikit/config/run_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace verikit {
namespace config {

#define VK_CONFIG_STATUS(message)                                                        \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message), api::ErrorModule::kConfig, \
                          api::detail::kConfigInvalidOption)

namespace {

std::string Trim(const std::string& s) {
  const size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  const size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseUnsigned(const std::string& value, std::uint64_t max, std::uint64_t* out) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) return false;
  char* end = NULL;
  errno = 0;
  const unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0' || parsed > max) return false;
  *out = parsed;
  return true;
}

bool SetParallel(const std::string& v, RunConfig* c) {
  std::uint64_t n = 0;
  if (!ParseUnsigned(v, 4096, &n) || n == 0) return false;
  c->parallel = static_cast<std::size_t>(n);
  return true;
}

bool SetTimeout(const std::string& v, RunConfig* c) {
  std::uint64_t n = 0;
  if (!ParseUnsigned(v, std::numeric_limits<std::uint32_t>::max(), &n)) return false;
  c->timeout_seconds = static_cast<std::uint32_t>(n);
  return true;
}

bool SetGrace(const std::string& v, RunConfig* c) {
  std::uint64_t n = 0;
  if (!ParseUnsigned(v, std::numeric_limits<std::uint32_t>::max(), &n)) return false;
  c->grace_period_ms = static_cast<std::uint32_t>(n);
  return true;
}

bool SetRetries(const std::string& v, RunConfig* c) {
  std::uint64_t n = 0;
  if (!ParseUnsigned(v, 100, &n)) return false;
  c->max_retries = static_cast<std::uint32_t>(n);
  return true;
}

typedef bool (*ConfigSetter)(const std::string& value, RunConfig* config);

#define VK_STRING_SETTER(field)                  \
  [](const std::string& v, RunConfig* c) {        \
    if (v.empty()) return false;                  \
    c->field = v;                                 \
    return true;                                  \
  }

struct ConfigKey {
  const char* key;
  ConfigSetter set;
};

const ConfigKey kConfigKeys[] = {
    {"target", VK_STRING_SETTER(target)},
    {"parallel", &SetParallel},
    {"timeout", &SetTimeout},
    {"grace_ms", &SetGrace},
    {"max_retries", &SetRetries},
    {"fail_fast", [](const std::string& v, RunConfig* c) { return ParseBool(v, &c->fail_fast); }},
    {"catalog", VK_STRING_SETTER(catalog_path)},
    {"summary", VK_STRING_SETTER(summary_path)},
    {"log_dir", VK_STRING_SETTER(log_dir)},
    {"log_config", VK_STRING_SETTER(log_config)},
    {"workdir", VK_STRING_SETTER(workdir)},
    {"verbose", [](const std::string& v, RunConfig* c) { return ParseBool(v, &c->verbose); }},
};

#undef VK_STRING_SETTER

// Options that take a value, mapped to the config-file key that sets it.
struct ValueOption {
  const char* short_name;
  const char* long_name;
  const char* key;
};

const ValueOption kValueOptions[] = {
    {"-t", "--timeout", "timeout"},
    {"-p", "--parallel", "parallel"},
    {NULL, "--grace-ms", "grace_ms"},
    {NULL, "--max-retries", "max_retries"},
    {NULL, "--catalog", "catalog"},
    {NULL, "--summary", "summary"},
    {NULL, "--log-dir", "log_dir"},
    {NULL, "--log-config", "log_config"},
    {NULL, "--workdir", "workdir"},
};

const ConfigKey* FindKey(const std::string& key) {
  for (size_t i = 0; i < sizeof(kConfigKeys) / sizeof(kConfigKeys[0]); ++i) {
    if (key == kConfigKeys[i].key) return &kConfigKeys[i];
  }
  return NULL;
}

const ValueOption* FindValueOption(const std::string& arg) {
  for (size_t i = 0; i < sizeof(kValueOptions) / sizeof(kValueOptions[0]); ++i) {
    const ValueOption& opt = kValueOptions[i];
    if ((opt.short_name != NULL && arg == opt.short_name) || arg == opt.long_name) return &opt;
  }
  return NULL;
}

}  // namespace

api::Status ParseRunConfig(std::istream& input, RunConfig* config) {
  if (config == NULL) return VK_CONFIG_STATUS("config is null");
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;

    const size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) {
      return VK_CONFIG_STATUS("line " + std::to_string(line_no) + ": expected key = value");
    }
    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    std::string value = Trim(trimmed.substr(sep + 1));
    const size_t comment = std::min(value.find('#'), value.find("//"));
    if (comment != std::string::npos) value = Trim(value.substr(0, comment));

    const ConfigKey* entry = FindKey(key);
    if (entry == NULL) continue;
    if (!entry->set(value, config)) {
      return VK_CONFIG_STATUS("line " + std::to_string(line_no) + ": invalid value for '" + key +
                              "': '" + value + "'");
    }
  }
  return api::Status::Ok();
}

api::Status LoadRunConfigFile(const std::string& path, RunConfig* config) {
  std::ifstream input(path.c_str());
  if (!input.is_open()) return VK_CONFIG_STATUS("cannot open config file: " + path);
  api::Status st = ParseRunConfig(input, config);
  if (!st.ok()) return VK_CONFIG_STATUS(path + ": " + st.message());
  return st;
}

api::Status ParseCommandLine(int argc, const char* const* argv, RunConfig* config) {
  if (config == NULL) return VK_CONFIG_STATUS("config is null");
  bool have_target = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      config->show_help = true;
    } else if (arg == "--version") {
      config->show_version = true;
    } else if (arg == "--fail-fast") {
      config->fail_fast = true;
    } else if (arg == "--dry-run") {
      config->dry_run = true;
    } else if (arg == "--list") {
      config->list = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config->verbose = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) return VK_CONFIG_STATUS(arg + " expects a value");
      config->config_path = argv[++i];
    } else if (const ValueOption* opt = FindValueOption(arg)) {
      if (i + 1 >= argc) return VK_CONFIG_STATUS(arg + " expects a value");
      const std::string value = argv[++i];
      if (!FindKey(opt->key)->set(value, config)) {
        return VK_CONFIG_STATUS("invalid value for " + arg + ": '" + value + "'");
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return VK_CONFIG_STATUS("unknown option: " + arg);
    } else {
      if (have_target) return VK_CONFIG_STATUS("more than one task given: " + arg);
      if (arg.empty()) return VK_CONFIG_STATUS("empty task name");
      config->target = arg;
      have_target = true;
    }
  }
  return api::Status::Ok();
}

api::Status BuildRunConfig(int argc, const char* const* argv, RunConfig* config) {
  if (config == NULL) return VK_CONFIG_STATUS("config is null");
  // First pass only to find -c; values are applied in the second.
  RunConfig scan;
  api::Status st = ParseCommandLine(argc, argv, &scan);
  if (!st.ok()) return st;

  RunConfig merged;
  if (!scan.config_path.empty()) {
    st = LoadRunConfigFile(scan.config_path, &merged);
    if (!st.ok()) return st;
  }
  st = ParseCommandLine(argc, argv, &merged);
  if (!st.ok()) return st;
  *config = merged;
  return api::Status::Ok();
}

api::Status ValidateRunConfig(const RunConfig& config) {
  if (config.target.empty()) return VK_CONFIG_STATUS("no task requested");
  if (config.summary_path.empty()) return VK_CONFIG_STATUS("summary path is empty");
  if (config.log_dir.empty()) return VK_CONFIG_STATUS("log dir is empty");
  return api::Status::Ok();
}

std::string UsageText(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [OPTIONS] [TASK|all]\n"
      << "\n"
      << "Options:\n"
      << "  -c, --config FILE        run configuration file (key = value)\n"
      << "  -t, --timeout SECONDS    per-task timeout, 0 disables (default 0)\n"
      << "  -p, --parallel COUNT     concurrency limit (default: hardware threads)\n"
      << "      --grace-ms MS        grace period after cancellation (default 2000)\n"
      << "      --max-retries N      re-run a failed task up to N more times (default 0)\n"
      << "      --fail-fast          stop launching after the first failure\n"
      << "      --catalog FILE       task catalog JSON (default: built-in catalog)\n"
      << "      --summary FILE       summary JSON path (default verikit-summary.json)\n"
      << "      --log-dir DIR        verifier log directory (default logs)\n"
      << "      --log-config FILE    logging configuration file\n"
      << "      --workdir DIR        working directory for verifier processes\n"
      << "      --dry-run            print the resolved order and exit\n"
      << "      --list               list declared tasks and exit\n"
      << "  -v, --verbose            verbose logging\n"
      << "  -h, --help               show this help\n"
      << "      --version            show version\n"
      << "\n"
      << "Exit codes: 0 success, 1 failure, 2 timeout, 3 configuration error, 4 internal error\n";
  return out.str();
}

#undef VK_CONFIG_STATUS

}  // namespace config
}  // namespace verikit
