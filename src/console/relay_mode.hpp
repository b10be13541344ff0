#pragma once

#include "config.hpp"

#include <string>

// Reads external recognizer states (one JSON object per line) from stdin,
// renders the resulting updates and optionally exports the transcript.
int run_relay(const Config& config, const std::string& export_dir, bool verbose);
