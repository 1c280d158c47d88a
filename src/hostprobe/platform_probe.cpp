#include "hostprobe/platform_probe.hpp"

#include "core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace batchexec::hostprobe {

namespace {

std::string ToLower(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

bool ReadTextFile(const std::filesystem::path& path, std::string& text) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  return true;
}

} // namespace

const char* ToString(Platform platform) {
  switch (platform) {
  case Platform::kLinux:
    return "linux";
  case Platform::kMacOs:
    return "darwin";
  case Platform::kWindows:
    return "mswin32";
  case Platform::kCygwin:
    return "cygwin";
  case Platform::kOtherUnix:
    return "unix";
  case Platform::kUnknown:
    return "unknown";
  }
  return "unknown";
}

Platform DetectPlatform() {
#if defined(__CYGWIN__)
  return Platform::kCygwin;
#elif defined(_WIN32)
  return Platform::kWindows;
#elif defined(__linux__)
  return Platform::kLinux;
#elif defined(__APPLE__)
  return Platform::kMacOs;
#elif defined(__unix__)
  return Platform::kOtherUnix;
#else
  return Platform::kUnknown;
#endif
}

bool IsUnixLike(Platform platform) {
  return platform == Platform::kLinux || platform == Platform::kCygwin ||
         platform == Platform::kMacOs || platform == Platform::kOtherUnix;
}

bool IsWindowsLike(Platform platform) {
  return platform == Platform::kWindows || platform == Platform::kCygwin;
}

bool ReleaseTextSuggestsWsl(std::string_view release_text) {
  return ToLower(release_text).find("microsoft") != std::string::npos;
}

bool DetectWsl(std::string_view wsl_env, const std::filesystem::path& release_path,
               const std::filesystem::path& version_path, bool& on_wsl, std::string& error) {
  error.clear();
  on_wsl = false;

  if (!wsl_env.empty()) {
    on_wsl = true;
    return true;
  }

  std::string text;
  if (!ReadTextFile(release_path, text) && !ReadTextFile(version_path, text)) {
    error = "unable to read platform release from '" + release_path.string() + "' or '" +
            version_path.string() + "'";
    return false;
  }

  on_wsl = ReleaseTextSuggestsWsl(text);
  return true;
}

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error, bool merge_stderr) {
  output.clear();
  exit_code = -1;
  error.clear();

  if (command.empty()) {
    error = "command must not be empty";
    return false;
  }

  const std::string wrapped = merge_stderr ? command + " 2>&1" : command;
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  std::size_t bytes = 0;
  while ((bytes = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0U) {
    output.append(buffer, bytes);
  }

#if defined(_WIN32)
  const int raw_status = _pclose(pipe);
  exit_code = raw_status;
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif

  return true;
}

std::vector<std::string> SplitOutputLines(std::string_view output, bool strip_blank) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin < output.size()) {
    std::size_t end = output.find('\n', begin);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    // Cleanup runs per line so a CR never reaches back into the previous line ending.
    std::string line =
        core::StripNulBytes(core::StripCarriageReturns(output.substr(begin, end - begin)));
    begin = end + 1;
    if (strip_blank && line.empty()) {
      continue;
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace batchexec::hostprobe
