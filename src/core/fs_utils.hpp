#ifndef BATCHEXEC_CORE_FS_UTILS_HPP_
#define BATCHEXEC_CORE_FS_UTILS_HPP_

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace batchexec::core {

namespace detail {

inline std::filesystem::perms PermissionBits(char who, char what) {
  namespace fs = std::filesystem;
  const int column = what == 'r' ? 0 : what == 'w' ? 1 : 2;
  const fs::perms owner[3] = {fs::perms::owner_read, fs::perms::owner_write,
                              fs::perms::owner_exec};
  const fs::perms group[3] = {fs::perms::group_read, fs::perms::group_write,
                              fs::perms::group_exec};
  const fs::perms others[3] = {fs::perms::others_read, fs::perms::others_write,
                               fs::perms::others_exec};

  fs::perms bits = fs::perms::none;
  if (who == 'u' || who == 'a') {
    bits |= owner[column];
  }
  if (who == 'g' || who == 'a') {
    bits |= group[column];
  }
  if (who == 'o' || who == 'a') {
    bits |= others[column];
  }
  return bits;
}

} // namespace detail

// Parsed chmod-style request, e.g. "a+x", "u+w", "a-w" or "0755".
struct PermissionChange {
  std::filesystem::perms bits = std::filesystem::perms::none;
  std::filesystem::perm_options mode = std::filesystem::perm_options::replace;
};

inline bool ParsePermissionSpec(std::string_view spec, PermissionChange& change,
                                std::string& error) {
  namespace fs = std::filesystem;
  error.clear();
  change = PermissionChange{};

  if (spec.empty()) {
    error = "permission spec cannot be empty";
    return false;
  }

  if (std::isdigit(static_cast<unsigned char>(spec.front())) != 0) {
    unsigned value = 0;
    for (const char c : spec) {
      if (c < '0' || c > '7') {
        error = "invalid octal permission spec '" + std::string(spec) + "'";
        return false;
      }
      value = value * 8U + static_cast<unsigned>(c - '0');
    }
    change.bits = static_cast<fs::perms>(value) & fs::perms::mask;
    change.mode = fs::perm_options::replace;
    return true;
  }

  std::size_t cursor = 0;
  std::string who;
  constexpr std::string_view kWho = "ugoa";
  constexpr std::string_view kOps = "+-=";
  while (cursor < spec.size() && kWho.find(spec[cursor]) != std::string_view::npos) {
    who.push_back(spec[cursor]);
    ++cursor;
  }
  if (who.empty()) {
    who = "a";
  }
  if (cursor >= spec.size() || kOps.find(spec[cursor]) == std::string_view::npos) {
    error = "permission spec '" + std::string(spec) + "' must contain one of + - =";
    return false;
  }
  const char op = spec[cursor++];
  if (cursor >= spec.size()) {
    error = "permission spec '" + std::string(spec) + "' names no permission bits";
    return false;
  }

  for (; cursor < spec.size(); ++cursor) {
    const char what = spec[cursor];
    if (what != 'r' && what != 'w' && what != 'x') {
      error = "invalid permission bit '" + std::string(1, what) + "' in '" +
              std::string(spec) + "'";
      return false;
    }
    for (const char w : who) {
      change.bits |= detail::PermissionBits(w, what);
    }
  }

  change.mode = op == '+'   ? fs::perm_options::add
                : op == '-' ? fs::perm_options::remove
                            : fs::perm_options::replace;
  return true;
}

inline bool ApplyPermissions(const std::filesystem::path& path, const PermissionChange& change,
                             std::string& error) {
  std::error_code ec;
  std::filesystem::permissions(path, change.bits, change.mode, ec);
  if (ec) {
    error = "failed to change permissions on '" + path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    error = "could not create directory '" + dir.string() + "'";
    return false;
  }
  return true;
}

// Removes `dir` and everything beneath it.
inline bool RemoveTree(const std::filesystem::path& dir, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    error = "directory does not exist '" + dir.string() + "'";
    return false;
  }
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    error = "failed to remove directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool IsReadableAndExecutable(const std::filesystem::path& path) {
#if defined(_WIN32)
  std::error_code ec;
  return std::filesystem::exists(path, ec);
#else
  return ::access(path.c_str(), R_OK | X_OK) == 0;
#endif
}

inline bool IsWritable(const std::filesystem::path& path) {
#if defined(_WIN32)
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  return !ec && (status.permissions() & std::filesystem::perms::owner_write) !=
                    std::filesystem::perms::none;
#else
  return ::access(path.c_str(), W_OK) == 0;
#endif
}

} // namespace batchexec::core

#endif // BATCHEXEC_CORE_FS_UTILS_HPP_
