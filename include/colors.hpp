#pragma once

#include <string>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";     // For errors
    const std::string GREEN = "\033[32m";   // For progress
    const std::string DIM = "\033[2m";      // For info lines
}
