#pragma once

#include <string>
#include <string_view>
#include "app/MonitorConfig.hpp"

namespace vigil::app {

// $XDG_CONFIG_HOME/vigil/config.toml, else $HOME/.config/vigil/config.toml;
// empty if neither variable is set.
std::string config_file_path();

// Resolve every field TOML -> environment -> compiled default. An explicit
// `path` must exist; the default path may be missing. Present but malformed
// values throw InvalidConfig. The result is validated.
[[nodiscard]] MonitorConfig load_config(const std::string& path = {});

// Environment variable helpers (VIGIL_X and vigil_X are equivalent)
const char* getenv_compat(const char* name);

// Strict scalar parsers; `what` names the field in the InvalidConfig message.
[[nodiscard]] int parse_int_value(std::string_view text, std::string_view what);
[[nodiscard]] double parse_double_value(std::string_view text, std::string_view what);
[[nodiscard]] bool parse_bool_value(std::string_view text, std::string_view what);

// "cpu=80" / "disk.critical=95" -> patch entry. Throws InvalidConfig.
void parse_threshold_assignment(std::string_view text, ConfigPatch& patch);

} // namespace vigil::app
