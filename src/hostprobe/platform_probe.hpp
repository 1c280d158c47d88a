#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace batchexec::hostprobe {

// Build-target platform family.
enum class Platform {
  kLinux,
  kMacOs,
  kWindows,
  kCygwin,
  kOtherUnix,
  kUnknown,
};

const char* ToString(Platform platform);

Platform DetectPlatform();

// Unix-like covers Linux, Cygwin, macOS and the other Unix families.
bool IsUnixLike(Platform platform);
// Windows-like covers native Windows and Cygwin; WSL is decided separately.
bool IsWindowsLike(Platform platform);

// Case-insensitive search for "microsoft" in a kernel release string.
bool ReleaseTextSuggestsWsl(std::string_view release_text);

// Decides whether a Linux host is a WSL guest.
//
// Lookup order:
// 1) non-empty `wsl_env` (WSL_DISTRO_NAME) means yes
// 2) contents of `release_path`, else `version_path`
//
// Returns false with `error` set when neither file can be read.
bool DetectWsl(std::string_view wsl_env, const std::filesystem::path& release_path,
               const std::filesystem::path& version_path, bool& on_wsl, std::string& error);

// Runs `command` through the shell and captures its stdout (and stderr when
// `merge_stderr`). `exit_code` is the decoded process status.
bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error, bool merge_stderr = false);

// Splits captured output on LF, then removes NUL bytes and carriage returns
// from each line. `strip_blank` drops lines left empty.
std::vector<std::string> SplitOutputLines(std::string_view output, bool strip_blank);

} // namespace batchexec::hostprobe
