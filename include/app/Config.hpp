#pragma once

#include <string>
#include "model/Config.hpp"

namespace sysmaint::app {

// Default config location: $XDG_CONFIG_HOME/sysmaint/config.toml, else
// $HOME/.config/sysmaint/config.toml. Empty if neither variable is set.
std::string config_file_path();

// Build the run configuration: TOML file -> environment -> compiled default,
// per key. `path` overrides the default location; a missing default file is
// not an error, a missing explicit file is (std::runtime_error).
sysmaint::model::MaintenanceConfig load_config(const std::string& path = "");

// Environment variable helpers (SYSMAINT_X also answers to sysmaint_X)
const char* getenv_compat(const char* name);
double getenv_double(const char* name, double defv);

} // namespace sysmaint::app
