#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace safeid::cli::fmt::ansi {

// Styling is applied only when stdout is a terminal, so piped ids and JSON
// stay clean.
inline auto stdout_is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

inline auto styled(std::string_view text, int sgr) -> std::string {
  if (!stdout_is_tty()) {
    return std::string(text);
  }
  return std::format("\033[{}m{}\033[0m", sgr, text);
}

inline auto bold(std::string_view text) -> std::string {
  return styled(text, 1);
}
inline auto yellow(std::string_view text) -> std::string {
  return styled(text, 33);
}
inline auto cyan(std::string_view text) -> std::string {
  return styled(text, 36);
}

} // namespace safeid::cli::fmt::ansi
