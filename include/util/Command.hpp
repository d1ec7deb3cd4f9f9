#pragma once
#include <optional>
#include <string>

namespace sysmaint::util {

struct CommandResult {
  int exit_code{-1};  // -1 when the child did not exit normally
  std::string output; // combined stdout/stderr, trailing whitespace trimmed
};

// Run cmd through /bin/sh with stderr folded into stdout.
// Returns std::nullopt when the shell could not be spawned.
[[nodiscard]] auto run_command(const std::string& cmd) -> std::optional<CommandResult>;

// First executable named `name` on PATH, or empty string.
[[nodiscard]] auto find_in_path(const std::string& name) -> std::string;

// Single-quote s for /bin/sh.
[[nodiscard]] auto shell_quote(const std::string& s) -> std::string;

} // namespace sysmaint::util
