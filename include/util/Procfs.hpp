// Helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace vigil::util {

// Map an absolute /proc path to an alternate root if VIGIL_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Parse an unsigned decimal, skipping leading blanks and trailing units (e.g. "kB").
// Returns std::nullopt if no digits are present.
auto parse_u64(std::string_view sv) -> std::optional<unsigned long long>;

} // namespace vigil::util
