#pragma once

#include <string>

namespace platform {

// Each returns an empty string when no suitable base directory is known.
std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();

} // namespace platform
