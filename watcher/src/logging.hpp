#pragma once

#include <string>

// Console sink always; a size-rotated file sink when log_file is set
void setup_logging(const std::string& name, const std::string& log_level, const std::string& log_file);
