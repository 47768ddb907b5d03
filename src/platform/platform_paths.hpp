#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/speak-dispatch or ~/.config/speak-dispatch, empty if neither is set.
std::string config_dir();

} // namespace platform
