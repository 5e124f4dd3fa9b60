#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace inference_gateway {
// Logging utilities
// -----------------
// Console writes share one mutex so lines emitted by the dispatcher, the
// sweeper and the gRPC threads never interleave.

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

// =============================================================================
// Utility: parse verbosity level from a name or a number
// =============================================================================

inline auto
parse_verbosity_level(const std::string& val) -> VerbosityLevel
{
  static constexpr std::array<std::pair<std::string_view, VerbosityLevel>, 5>
      kNames{{
          {"silent", VerbosityLevel::Silent},
          {"info", VerbosityLevel::Info},
          {"stats", VerbosityLevel::Stats},
          {"debug", VerbosityLevel::Debug},
          {"trace", VerbosityLevel::Trace},
      }};

  const auto first = val.find_first_not_of(" \t\n\r\f\v");
  const auto last = val.find_last_not_of(" \t\n\r\f\v");
  const std::string trimmed = first == std::string::npos
                                  ? std::string{}
                                  : val.substr(first, last - first + 1);
  if (trimmed.empty()) {
    throw std::invalid_argument("Invalid verbosity level: " + trimmed);
  }

  if (std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    if (trimmed.size() > 1) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    const auto index = static_cast<std::size_t>(trimmed.front() - '0');
    if (index >= kNames.size()) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    return kNames[index].second;
  }

  std::string lower(trimmed.size(), '\0');
  std::transform(
      trimmed.begin(), trimmed.end(), lower.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& [name, level] : kNames) {
    if (lower == name) {
      return level;
    }
  }
  throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

inline auto
verbosity_style(const VerbosityLevel level)
    -> std::pair<const char*, const char*>
{
  using enum VerbosityLevel;
  switch (level) {
    case Info:
      return {"\x1b[1;32m", "[INFO] "};  // Green
    case Stats:
      return {"\x1b[1;35m", "[STATS] "};  // Magenta
    case Debug:
      return {"\x1b[1;34m", "[DEBUG] "};  // Blue
    case Trace:
      return {"\x1b[1;90m", "[TRACE] "};  // Gray
    default:
      return {"", ""};
  }
}

// =============================================================================
// Verbosity-controlled logging
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (std::to_underlying(current_level) >= std::to_underlying(level)) {
    auto [color, label] = verbosity_style(level);
    const std::scoped_lock lock(log_mutex);
    std::cout << color << label << message << "\x1b[0m\n" << std::flush;
  }
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// =============================================================================
// Unconditional stderr logging
// =============================================================================

inline void
log_warning(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;33m[WARNING] " << message << "\x1b[0m\n" << std::flush;
}

inline void
log_error(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;31m[ERROR] " << message << "\x1b[0m\n" << std::flush;
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  {
    const std::scoped_lock lock(log_mutex);
    std::cerr << "\x1b[1;41m[FATAL] " << message << "\x1b[0m\n";
  }
  std::terminate();
}
}  // namespace inference_gateway
