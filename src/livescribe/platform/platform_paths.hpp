#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if it cannot be determined.
std::string config_dir();

// Default directory for exported transcripts.
std::string data_dir();

} // namespace platform
