#pragma once

#include "attributes/attribute_registry.hpp"
#include "attributes/clone_engine.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "core/text_utils.hpp"
#include "lov/enum_registry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace batchexec::exec {

// Called when a failure is escalated under `fatal=1`. The default handler
// exits the process with ExitCode::kFatal; tests install one that records.
using TerminateHandler = std::function<void(int exit_code, const std::string& message)>;

// Return value of operations that coughed without terminating.
inline constexpr int kCoughSentinel = -1;

struct ExecutiveOptions {
  // Attribute name -> value, applied as both value and default after
  // construction. "fatal" is applied first so it governs the rest.
  std::map<std::string, std::string> overrides;
  // Falls back to BATCHEXEC_LOG_LEVEL, then info.
  std::optional<core::logging::LogLevel> min_log_level;
  // Defaults to std::cerr.
  std::ostream* log_sink = nullptr;
  // Defaults to lov::SharedEnumRegistry().
  lov::EnumRegistry* enum_registry = nullptr;
  TerminateHandler terminate_handler;
  // Path of the running program; drives the `this` and `prefix` attributes.
  std::filesystem::path program_path;
};

// Batch executive: the host object whose configuration lives in an
// AttributeRegistry and whose failures pass through one escalation point
// (Cough) governed by the `fatal` attribute.
class Executive {
public:
  static constexpr std::string_view kClassName = "batchexec::Executive";

  explicit Executive(ExecutiveOptions options = {});
  ~Executive();

  Executive(const Executive&) = delete;
  Executive& operator=(const Executive&) = delete;

  attributes::AttributeRegistry& Attributes() {
    return attributes_;
  }
  const attributes::AttributeRegistry& Attributes() const {
    return attributes_;
  }
  core::logging::Logger& Log() {
    return *logger_;
  }
  lov::EnumRegistry& Lov() {
    return *enum_registry_;
  }

  std::uint64_t Id() const {
    return id_;
  }
  static std::uint64_t LiveObjects();

  // Escalation point. Fatal mode logs at error level and calls the terminate
  // handler; otherwise logs a warning. Returns kCoughSentinel when control
  // comes back.
  int Cough(std::string_view message);
  int Cough(const core::errors::Error& error);

  bool Fatal() const;
  bool Echo() const;

  bool Has(std::string_view name) const;
  attributes::AttributeValue Get(std::string_view name);
  // 0 on success, kCoughSentinel otherwise.
  int Set(std::string_view name, attributes::AttributeValue value);
  int Set(std::string_view name, attributes::AttributeValue value,
          attributes::AttributeValue new_default);

  // Class name followed by the sorted public attribute names.
  std::vector<std::string> ListAttributes(bool verbose = false);

  // Flattens a value into one log-friendly line. When `thing` names an
  // attribute its value is rendered, otherwise `thing` itself. A non-empty
  // `desc` is prepended.
  std::string Dump(std::string_view thing, std::string_view desc = "");
  std::string Dump(const std::vector<std::string>& items, std::string_view desc = "");
  std::string Dump(const std::map<std::string, std::string>& items, std::string_view desc = "");

  // LoV helpers over the injected EnumRegistry.
  int LovRegister(std::string_view class_name, const lov::EnumEntries& entries);
  std::size_t LovClear(std::string_view class_name);
  std::vector<std::string> LovKeys(std::string_view class_name);
  std::optional<std::string> LovLookup(std::string_view class_name, std::string_view key);
  std::optional<std::string> LovRandom(std::string_view class_name,
                                       attributes::AttributeRegistry& target,
                                       std::string_view attr_name);
  attributes::AttributeValue LovDefault(std::string_view class_name,
                                        attributes::AttributeRegistry& target,
                                        std::string_view attr_name, std::string_view key);
  attributes::AttributeValue LovSet(std::string_view class_name,
                                    attributes::AttributeRegistry& target,
                                    std::string_view attr_name, std::string_view key);

  // Copied count, or kCoughSentinel.
  int Clone(const Executive& source,
            attributes::ClonePolicy policy = attributes::ClonePolicy::kNormal);
  int Inherit(const Executive& source);

  std::string Trim(std::string_view text, std::string_view pattern);
  std::string TrimWs(std::string_view text);
  std::string Trunc(std::string_view text, std::optional<std::size_t> max_len = std::nullopt);
  std::string Crlf(std::string_view text);
  std::size_t Tabulate(const std::vector<core::TableRecord>& records,
                       std::string_view sort_key = "name");

  bool OnLinux() const;
  bool OnWindows() const;
  bool OnCygwin() const;
  bool OnWsl();
  bool LikeUnix() const;
  bool LikeWindows();
  std::vector<std::string> OsVersion();

  // 1 for a standard descriptor (no higher than `stdfd`), 0 for any other,
  // -1 when there is no descriptor to classify.
  int IsStdio(int fd);
  int IsStdio(std::FILE* stream);
  // Login name of the real user, empty after a cough.
  std::string Whoami();

  std::vector<std::string> CommandToLines(const std::string& command, bool strip_blank = false);
  std::vector<std::string> CommandToTokens(const std::string& command);
  std::vector<std::string> Where(std::string_view executable);

  // Directory and permission helpers. Int returns follow the cough contract:
  // 0 success, kCoughSentinel on a non-fatal failure.
  int MkDir(const std::filesystem::path& dir);
  int RmDir(const std::filesystem::path& dir);
  int Delete(const std::vector<std::filesystem::path>& paths);
  // `type` is 'd' (directory), 'f' (regular file) or 'e' (anything).
  bool Extant(const std::filesystem::path& path, char type = 'd');
  bool IsRx(const std::filesystem::path& path, char type = 'd');
  bool IsRwx(const std::filesystem::path& path, char type = 'd');
  int CkDir(const std::filesystem::path& dir);
  int GoDir(std::optional<std::filesystem::path> dir = std::nullopt);
  std::filesystem::path Pwd();
  std::size_t Chmod(std::string_view perms, const std::vector<std::filesystem::path>& paths);
  std::size_t MkExec(const std::vector<std::filesystem::path>& paths);
  std::size_t MkRo(const std::vector<std::filesystem::path>& paths);
  std::size_t MkWrite(const std::vector<std::filesystem::path>& paths);

  // Writes the generated-file banner when `autoheader` is set.
  bool Header(std::ostream& out);

private:
  void DefineAttributes();
  void ApplyOverrides(const std::map<std::string, std::string>& overrides);
  void Define(std::string_view name, attributes::AttributeKind kind,
              attributes::AttributeValue value,
              attributes::AttributeValue default_value = std::nullopt);
  std::string Text(std::string_view name);
  bool Flag(std::string_view name) const;

  std::shared_ptr<core::logging::Logger> logger_;
  attributes::AttributeRegistry attributes_;
  lov::EnumRegistry* enum_registry_ = nullptr;
  TerminateHandler terminate_handler_;
  std::filesystem::path program_path_;
  std::uint64_t id_ = 0;

  static std::atomic<std::uint64_t> next_id_;
  static std::atomic<std::uint64_t> live_objects_;
};

} // namespace batchexec::exec
