// C++23 utility helpers for reading /proc with optional root remap
#pragma once
#include <string>
#include <optional>

namespace sysmaint::util {

// Map an absolute /proc path to an alternate root if SYSMAINT_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

} // namespace sysmaint::util
