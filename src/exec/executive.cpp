#include "exec/executive.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "hostprobe/platform_probe.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#if !defined(_WIN32)
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace batchexec::exec {

using attributes::AttributeKind;
using attributes::AttributeValue;
using core::errors::Error;
using core::errors::ErrorCode;
using core::logging::LogLevel;

std::atomic<std::uint64_t> Executive::next_id_{0};
std::atomic<std::uint64_t> Executive::live_objects_{0};

namespace {

constexpr const char* kEnvLogLevel = "BATCHEXEC_LOG_LEVEL";
constexpr const char* kEnvWslDistro = "WSL_DISTRO_NAME";

constexpr std::string_view kOsIssuePath = "/etc/issue";
constexpr std::string_view kOsReleasePath = "/proc/version";
constexpr std::string_view kOsVersionPath = "/proc/sys/kernel/osrelease";
constexpr std::string_view kStdFdMax = "2";

std::string EnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value == nullptr ? std::string() : std::string(value);
}

fs::path ResolveProgramPath() {
  std::error_code ec;
  fs::path resolved = fs::read_symlink("/proc/self/exe", ec);
  if (ec || resolved.empty()) {
    return fs::path("batchexec");
  }
  return resolved;
}

// Program name up to its first dot, e.g. "nightly.sh" -> "nightly".
std::string ProgramPrefix(const fs::path& program_path) {
  const std::string name = program_path.filename().string();
  const std::size_t dot = name.find('.');
  return dot == std::string::npos ? name : name.substr(0, dot);
}

void ExitProcess(int exit_code, const std::string& /*message*/) {
  std::exit(exit_code);
}

std::string FormatLocalTimestamp(std::chrono::system_clock::time_point ts) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm local_time{};
#if defined(_WIN32)
  if (localtime_s(&local_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (localtime_r(&epoch_seconds, &local_time) == nullptr) {
    return "";
  }
#endif
  std::ostringstream out;
  out << std::put_time(&local_time, "%a %b %e %H:%M:%S %Y");
  return out.str();
}

std::string JoinPaths(const std::vector<fs::path>& paths) {
  std::string joined;
  for (const fs::path& path : paths) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += path.string();
  }
  return joined;
}

// Single-quoted the way the dump format renders scalars.
std::string Quote(std::string_view text) {
  std::string quoted = "'";
  for (const char c : text) {
    if (c == '\'' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '\'';
  return quoted;
}

std::string DescPrefix(std::string_view desc) {
  return desc.empty() ? std::string() : std::string(desc) + " ";
}

} // namespace

Executive::Executive(ExecutiveOptions options)
    : logger_(std::make_shared<core::logging::Logger>(
          LogLevel::kInfo, options.log_sink != nullptr ? *options.log_sink : std::cerr)),
      attributes_(std::string(kClassName), logger_.get()),
      enum_registry_(options.enum_registry != nullptr ? options.enum_registry
                                                      : &lov::SharedEnumRegistry()),
      terminate_handler_(options.terminate_handler ? std::move(options.terminate_handler)
                                                   : TerminateHandler(ExitProcess)),
      program_path_(options.program_path.empty() ? ResolveProgramPath()
                                                 : std::move(options.program_path)),
      id_(next_id_.fetch_add(1U) + 1U) {
  ++live_objects_;
  logger_->SetScope(std::string(kClassName));

  if (options.min_log_level.has_value()) {
    logger_->SetMinLevel(options.min_log_level.value());
  } else if (const std::string env_level = EnvOrEmpty(kEnvLogLevel); !env_level.empty()) {
    LogLevel level = LogLevel::kInfo;
    std::string level_error;
    if (ParseLogLevel(env_level, level, level_error)) {
      logger_->SetMinLevel(level);
    } else {
      logger_->Warn("ignoring log level from environment", {{"error", level_error}});
    }
  }

  DefineAttributes();
  attributes_.SyncAll();

  Error error;
  std::size_t touched = 0;
  if (!attributes_.MarkReadOnly({"log"}, touched, error)) {
    Cough(error);
  }
  attributes_.CaptureInheritable();

  ApplyOverrides(options.overrides);

  if (options.overrides.find("cmd_os_version") == options.overrides.end()) {
    Set("cmd_os_version", std::string(OnWindows() ? "ver" : "uname"));
  }
  if (options.overrides.find("cmd_os_where") == options.overrides.end()) {
    Set("cmd_os_where", std::string(OnWindows() ? "where" : "which"));
  }

  logger_->Trace("executive created", {{"id", std::to_string(id_)}});
}

Executive::~Executive() {
  --live_objects_;
  logger_->Trace("executive destroyed", {{"id", std::to_string(id_)}});
}

std::uint64_t Executive::LiveObjects() {
  return live_objects_.load();
}

void Executive::Define(std::string_view name, AttributeKind kind, AttributeValue value,
                       AttributeValue default_value) {
  Error error;
  if (!attributes_.Define(name, kind, std::move(value), std::move(default_value), error)) {
    Cough(error);
  }
}

void Executive::DefineAttributes() {
  Error error;
  if (!attributes_.DefineHandle("log", logger_, error)) {
    Cough(error);
  }

  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  const std::string wsl_env = EnvOrEmpty(kEnvWslDistro);

  Define("leader", AttributeKind::kAny, std::string("#"));
  Define("autoheader", AttributeKind::kBoolean, std::string("0"), std::string("0"));
  Define("cmd_os_version", AttributeKind::kAny, std::nullopt);
  Define("cmd_os_where", AttributeKind::kAny, std::nullopt);
  Define("dn_start", AttributeKind::kAny,
         ec ? AttributeValue(std::nullopt) : AttributeValue(cwd.string()));
  Define("echo", AttributeKind::kBoolean, std::string("0"), std::string("0"));
  Define("fatal", AttributeKind::kBoolean, std::string("1"), std::string("1"));
  Define("maxlen", AttributeKind::kAny, std::to_string(core::kDefaultMaxLen));
  Define("prefix", AttributeKind::kAny, ProgramPrefix(program_path_));
  Define("pn_issue", AttributeKind::kAny, std::string(kOsIssuePath));
  Define("pn_release", AttributeKind::kAny, std::string(kOsReleasePath));
  Define("pn_version", AttributeKind::kAny, std::string(kOsVersionPath));
  Define("re_whitespace", AttributeKind::kAny, std::string(core::kWhitespacePattern));
  Define("stdfd", AttributeKind::kAny, std::string(kStdFdMax));
  Define("this", AttributeKind::kAny, program_path_.filename().string());
  Define("wsl_active", AttributeKind::kBoolean, std::string("0"), std::string("0"));
  Define("wsl_env", AttributeKind::kAny,
         wsl_env.empty() ? AttributeValue(std::nullopt) : AttributeValue(wsl_env));
}

void Executive::ApplyOverrides(const std::map<std::string, std::string>& overrides) {
  const auto apply = [this](const std::string& name, const std::string& value) {
    logger_->Debug("applying option", {{"attr", name}, {"value", value}});
    Set(name, value, value);
  };

  if (const auto fatal = overrides.find("fatal"); fatal != overrides.end()) {
    apply(fatal->first, fatal->second);
  }
  for (const auto& [name, value] : overrides) {
    if (name != "fatal") {
      apply(name, value);
    }
  }
}

int Executive::Cough(std::string_view message) {
  if (Fatal()) {
    logger_->Error("FATAL " + std::string(message));
    terminate_handler_(core::errors::ToInt(core::errors::ExitCode::kFatal),
                       std::string(message));
    return kCoughSentinel;
  }

  logger_->Warn("WARNING " + std::string(message));
  return kCoughSentinel;
}

int Executive::Cough(const Error& error) {
  return Cough(core::errors::FormatError(error));
}

bool Executive::Flag(std::string_view name) const {
  const attributes::AttributeDescriptor* attr = attributes_.Find(name);
  return attr != nullptr && attr->value.has_value() && attr->value.value() == "1";
}

bool Executive::Fatal() const {
  return Flag("fatal");
}

bool Executive::Echo() const {
  return Flag("echo");
}

std::string Executive::Text(std::string_view name) {
  return Get(name).value_or("");
}

bool Executive::Has(std::string_view name) const {
  return attributes_.Has(name);
}

AttributeValue Executive::Get(std::string_view name) {
  Error error;
  AttributeValue value;
  if (!attributes_.Get(name, value, error)) {
    Cough(error);
    return std::nullopt;
  }
  return value;
}

int Executive::Set(std::string_view name, AttributeValue value) {
  return Set(name, std::move(value), std::nullopt);
}

int Executive::Set(std::string_view name, AttributeValue value, AttributeValue new_default) {
  Error error;
  AttributeValue applied;
  if (!attributes_.Set(name, std::move(value), std::move(new_default), applied, error)) {
    return Cough(error);
  }
  return 0;
}

std::vector<std::string> Executive::ListAttributes(bool verbose) {
  std::vector<std::string> names = attributes_.List(verbose);
  if (Echo()) {
    std::string joined;
    for (const std::string& name : names) {
      joined += joined.empty() ? name : ", " + name;
    }
    logger_->Info("am [" + std::string(kClassName) + "] have [" + joined + "]");
  }
  names.insert(names.begin(), std::string(kClassName));
  return names;
}

std::string Executive::Dump(std::string_view thing, std::string_view desc) {
  if (!Has(thing)) {
    return DescPrefix(desc) + "scalar [" + std::string(thing) + "]";
  }

  std::string rendered = "undef";
  const attributes::AttributeDescriptor* attr = attributes_.Find(thing);
  if (attr->kind == AttributeKind::kOpaqueHandle) {
    rendered = "handle";
  } else if (attr->value.has_value()) {
    rendered = Quote(attr->value.value());
  }
  logger_->Trace("dumping attribute", {{"attr", thing}, {"value", rendered}});
  return DescPrefix(desc) + "attribute " + std::string(thing) + " [" + rendered + "]";
}

std::string Executive::Dump(const std::vector<std::string>& items, std::string_view desc) {
  std::string joined;
  for (const std::string& item : items) {
    joined += joined.empty() ? Quote(item) : ", " + Quote(item);
  }
  return DescPrefix(desc) + "array [" + joined + "]";
}

std::string Executive::Dump(const std::map<std::string, std::string>& items,
                            std::string_view desc) {
  std::string joined;
  for (const auto& [key, value] : items) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += Quote(key) + " => " + Quote(value);
  }
  return DescPrefix(desc) + "hash {" + joined + "}";
}

int Executive::LovRegister(std::string_view class_name, const lov::EnumEntries& entries) {
  Error error;
  std::size_t count = 0;
  if (!enum_registry_->Register(class_name, entries, count, error, logger_.get())) {
    return Cough(error);
  }
  return static_cast<int>(count);
}

std::size_t Executive::LovClear(std::string_view class_name) {
  return enum_registry_->Clear(class_name);
}

std::vector<std::string> Executive::LovKeys(std::string_view class_name) {
  Error error;
  std::vector<std::string> keys;
  if (!enum_registry_->Keys(class_name, keys, error)) {
    Cough(error);
    return {};
  }
  return keys;
}

std::optional<std::string> Executive::LovLookup(std::string_view class_name,
                                                std::string_view key) {
  Error error;
  std::string description;
  if (!enum_registry_->Lookup(class_name, key, description, error)) {
    Cough(error);
    return std::nullopt;
  }
  return description;
}

std::optional<std::string> Executive::LovRandom(std::string_view class_name,
                                                attributes::AttributeRegistry& target,
                                                std::string_view attr_name) {
  Error error;
  std::string chosen;
  if (!enum_registry_->Random(class_name, target, attr_name, chosen, error,
                               logger_.get())) {
    Cough(error);
    return std::nullopt;
  }
  return chosen;
}

AttributeValue Executive::LovDefault(std::string_view class_name,
                                     attributes::AttributeRegistry& target,
                                     std::string_view attr_name, std::string_view key) {
  Error error;
  AttributeValue result;
  if (!enum_registry_->ConditionalDefault(class_name, target, attr_name, key, result, error,
                                          logger_.get())) {
    Cough(error);
    return std::nullopt;
  }
  return result;
}

AttributeValue Executive::LovSet(std::string_view class_name,
                                 attributes::AttributeRegistry& target,
                                 std::string_view attr_name, std::string_view key) {
  Error error;
  AttributeValue result;
  if (!enum_registry_->ForceSet(class_name, target, attr_name, key, result, error,
                                logger_.get())) {
    Cough(error);
    return std::nullopt;
  }
  return result;
}

int Executive::Clone(const Executive& source, attributes::ClonePolicy policy) {
  Error error;
  attributes::CloneResult result;
  if (!attributes::Clone(attributes_, source.attributes_, policy, result, error,
                         logger_.get())) {
    return Cough(error);
  }
  return static_cast<int>(result.copied);
}

int Executive::Inherit(const Executive& source) {
  Error error;
  std::size_t copied = 0;
  if (!attributes::Inherit(attributes_, source.attributes_, copied, error, logger_.get())) {
    return Cough(error);
  }
  return static_cast<int>(copied);
}

std::string Executive::Trim(std::string_view text, std::string_view pattern) {
  std::string out;
  std::string error;
  if (!core::TrimPattern(text, pattern, out, error)) {
    Cough(error);
    return std::string(text);
  }
  logger_->Trace("trimmed", {{"before", text}, {"after", out}});
  return out;
}

std::string Executive::TrimWs(std::string_view text) {
  std::string pattern = Text("re_whitespace");
  if (pattern.empty()) {
    pattern = std::string(core::kWhitespacePattern);
  }
  return Trim(text, pattern);
}

std::string Executive::Trunc(std::string_view text, std::optional<std::size_t> max_len) {
  if (max_len.has_value()) {
    return core::Truncate(text, max_len.value());
  }

  const std::string raw = Text("maxlen");
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    Cough("attribute [maxlen] is not a length [" + raw + "]");
    parsed = core::kDefaultMaxLen;
  }
  return core::Truncate(text, parsed);
}

std::string Executive::Crlf(std::string_view text) {
  std::string stripped = core::StripCarriageReturns(text);
  if (stripped.size() != text.size()) {
    logger_->Trace("string truncated", {{"value", stripped}});
  }
  return stripped;
}

std::size_t Executive::Tabulate(const std::vector<core::TableRecord>& records,
                                std::string_view sort_key) {
  const std::string raw = Text("maxlen");
  std::size_t max_len = core::kDefaultMaxLen;
  std::from_chars(raw.data(), raw.data() + raw.size(), max_len);

  for (const std::string& line : core::Tabulate(records, sort_key, max_len)) {
    logger_->Info(line);
  }
  return records.size();
}

bool Executive::OnLinux() const {
  return hostprobe::DetectPlatform() == hostprobe::Platform::kLinux;
}

bool Executive::OnWindows() const {
  return hostprobe::DetectPlatform() == hostprobe::Platform::kWindows;
}

bool Executive::OnCygwin() const {
  return hostprobe::DetectPlatform() == hostprobe::Platform::kCygwin;
}

bool Executive::OnWsl() {
  if (!OnLinux()) {
    return false;
  }

  bool on_wsl = false;
  std::string error;
  if (!hostprobe::DetectWsl(Text("wsl_env"), Text("pn_release"), Text("pn_version"), on_wsl,
                            error)) {
    Cough("unable to determine platform [" +
          std::string(hostprobe::ToString(hostprobe::DetectPlatform())) + "]: " + error);
    return false;
  }
  Set("wsl_active", std::string(on_wsl ? "1" : "0"));
  return on_wsl;
}

bool Executive::LikeUnix() const {
  return hostprobe::IsUnixLike(hostprobe::DetectPlatform());
}

bool Executive::LikeWindows() {
  return hostprobe::IsWindowsLike(hostprobe::DetectPlatform()) || OnWsl();
}

std::vector<std::string> Executive::OsVersion() {
  std::vector<std::string> lines;

  const std::string wsl_env = Text("wsl_env");
  if (!wsl_env.empty()) {
    logger_->Info("retrieving WSL distro from environment");
    lines.push_back(wsl_env);
  } else {
    const std::string command =
        OnWsl() ? "cat " + Text("pn_issue") : Text("cmd_os_version");
    lines = CommandToLines(command, true);
    if (OnWindows() && !lines.empty()) {
      lines.erase(lines.begin());
    }
  }

  if (lines.empty()) {
    lines.emplace_back();
  }
  return lines;
}

int Executive::IsStdio(int fd) {
  if (fd < 0) {
    return -1;
  }
  logger_->Trace("fileno", {{"fd", std::to_string(fd)}});

  const std::string raw = Text("stdfd");
  int highest = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), highest);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    return Cough("attribute [stdfd] is not a descriptor [" + raw + "]");
  }
  return fd > highest ? 0 : 1;
}

int Executive::IsStdio(std::FILE* stream) {
  if (stream == nullptr) {
    return -1;
  }
#if defined(_WIN32)
  return IsStdio(::_fileno(stream));
#else
  return IsStdio(::fileno(stream));
#endif
}

std::string Executive::Whoami() {
  std::string user;
#if defined(_WIN32)
  user = EnvOrEmpty("USERNAME");
#else
  const passwd* entry = ::getpwuid(::getuid());
  if (entry != nullptr && entry->pw_name != nullptr) {
    user = entry->pw_name;
  }
#endif
  if (user.empty()) {
    Cough("unable to determine the current user");
    return {};
  }
  logger_->Debug("whoami", {{"user", user}});
  return user;
}

std::vector<std::string> Executive::CommandToLines(const std::string& command,
                                                   bool strip_blank) {
  if (Echo()) {
    logger_->Info("executing", {{"command", command}});
  }

  std::string output;
  std::string error;
  int exit_code = -1;
  if (!hostprobe::RunShellCommand(command, output, exit_code, error)) {
    Cough(error);
    return {};
  }
  if (output.empty()) {
    Cough("command returned no output [" + command + "]");
    return {};
  }

  std::vector<std::string> lines = hostprobe::SplitOutputLines(output, strip_blank);
  logger_->Debug("command finished", {{"command", command},
                                      {"exit_code", std::to_string(exit_code)},
                                      {"lines", std::to_string(lines.size())}});
  if (Echo()) {
    logger_->Info("command returned lines", {{"count", std::to_string(lines.size())}});
  }
  return lines;
}

std::vector<std::string> Executive::CommandToTokens(const std::string& command) {
  if (Echo()) {
    logger_->Info("executing", {{"command", command}});
  }

  std::string output;
  std::string error;
  int exit_code = -1;
  if (!hostprobe::RunShellCommand(command, output, exit_code, error)) {
    Cough(error);
    return {};
  }
  if (output.empty()) {
    Cough("command returned no output [" + command + "]");
    return {};
  }

  std::vector<std::string> tokens = core::SplitWhitespace(core::StripNulBytes(output));
  if (Echo()) {
    logger_->Info("command returned tokens", {{"count", std::to_string(tokens.size())}});
  }
  return tokens;
}

std::vector<std::string> Executive::Where(std::string_view executable) {
  if (executable.empty()) {
    Cough("where requires an executable name");
    return {};
  }
  return CommandToLines(Text("cmd_os_where") + " " + std::string(executable), true);
}

int Executive::MkDir(const fs::path& dir) {
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    return 0;
  }

  logger_->Info("creating directory", {{"dir", dir.string()}});
  std::string error;
  if (!core::EnsureDirectory(dir, error)) {
    return Cough(error);
  }
  return 0;
}

int Executive::RmDir(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return Cough("directory does not exist [" + dir.string() + "]");
  }
  if (Echo()) {
    logger_->Info("pruning directory", {{"dir", dir.string()}});
  }

  std::string error;
  if (!core::RemoveTree(dir, error)) {
    return Cough(error);
  }
  if (fs::is_directory(dir, ec)) {
    return Cough("could not prune directory [" + dir.string() + "]");
  }
  return 0;
}

int Executive::Delete(const std::vector<fs::path>& paths) {
  if (paths.empty()) {
    return Cough(Error{ErrorCode::kSyntax, "delete requires at least one path"});
  }

  std::size_t failed = 0;
  for (const fs::path& path : paths) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
      if (RmDir(path) != 0) {
        ++failed;
      }
      continue;
    }
    if (!fs::is_regular_file(path, ec)) {
      continue;
    }

    if (Echo()) {
      logger_->Info("removing file", {{"path", path.string()}});
    }
    fs::remove(path, ec);
    if (ec) {
      Cough("unlink(" + path.string() + ") failed: " + ec.message());
    }
    if (fs::is_regular_file(path, ec)) {
      Cough("could not remove file [" + path.string() + "]");
      ++failed;
    }
  }

  if (failed > 0U) {
    return Cough(std::to_string(failed) + " files could not be removed");
  }
  return 0;
}

bool Executive::Extant(const fs::path& path, char type) {
  std::error_code ec;
  bool exists = false;
  switch (type) {
  case 'd':
    exists = fs::is_directory(path, ec);
    break;
  case 'e':
    exists = fs::exists(path, ec);
    break;
  case 'f':
    exists = fs::is_regular_file(path, ec);
    break;
  default:
    Cough("invalid type [" + std::string(1, type) + "]");
    return false;
  }

  if (exists) {
    return true;
  }
  Cough("does not exist [" + path.string() + "]");
  return false;
}

bool Executive::IsRx(const fs::path& path, char type) {
  return Extant(path, type) && core::IsReadableAndExecutable(path);
}

bool Executive::IsRwx(const fs::path& path, char type) {
  return IsRx(path, type) && core::IsWritable(path);
}

int Executive::CkDir(const fs::path& dir) {
  if (IsRx(dir)) {
    return 0;
  }
  return Cough("directory [" + dir.string() + "] not accessible");
}

int Executive::GoDir(std::optional<fs::path> dir) {
  const fs::path target = dir.has_value() ? dir.value() : fs::path(Text("dn_start"));
  if (!IsRx(target)) {
    return Cough("invalid directory [" + target.string() + "]");
  }

  std::error_code ec;
  fs::current_path(target, ec);
  if (ec) {
    return Cough("chdir(" + target.string() + ") failed: " + ec.message());
  }
  Pwd();
  return 0;
}

fs::path Executive::Pwd() {
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    Cough("unable to read current directory: " + ec.message());
    return {};
  }
  logger_->Info("now in directory", {{"dir", cwd.string()}});
  return cwd;
}

std::size_t Executive::Chmod(std::string_view perms, const std::vector<fs::path>& paths) {
  if (paths.empty()) {
    Cough(Error{ErrorCode::kSyntax, "chmod requires at least one path"});
    return 0;
  }

  core::PermissionChange change;
  std::string error;
  if (!core::ParsePermissionSpec(perms, change, error)) {
    Cough(error);
    return 0;
  }

  std::vector<fs::path> missing;
  std::vector<fs::path> failed;
  std::size_t count = 0;
  for (const fs::path& path : paths) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      missing.push_back(path);
      continue;
    }
    if (core::ApplyPermissions(path, change, error)) {
      ++count;
    } else {
      logger_->Debug("chmod failed", {{"path", path.string()}, {"error", error}});
      failed.push_back(path);
    }
  }

  if (!missing.empty()) {
    logger_->Warn("pathname(s) do not exist", {{"paths", JoinPaths(missing)}});
  }
  if (!failed.empty()) {
    logger_->Warn("chmod failed on path(s)",
                  {{"perms", perms}, {"paths", JoinPaths(failed)}});
  }
  return count;
}

std::size_t Executive::MkExec(const std::vector<fs::path>& paths) {
  return Chmod("a+x", paths);
}

std::size_t Executive::MkRo(const std::vector<fs::path>& paths) {
  return Chmod("a-w", paths);
}

std::size_t Executive::MkWrite(const std::vector<fs::path>& paths) {
  return Chmod("u+w", paths);
}

bool Executive::Header(std::ostream& out) {
  if (!Flag("autoheader")) {
    if (Echo()) {
      logger_->Info("skipping automatic header");
    }
    return false;
  }

  const std::string leader = Text("leader");
  out << leader << " ---- automatically generated by " << Text("this") << " ----\n";
  out << leader << " ---- timestamp " << FormatLocalTimestamp(std::chrono::system_clock::now())
      << " ---- \n";
  if (!out) {
    Cough("failed to write header");
    return false;
  }
  return true;
}

} // namespace batchexec::exec
