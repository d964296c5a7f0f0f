#pragma once

#include <string>

/**
 * @brief Print message to stderr and exit the process with failure.
 */
[[noreturn]] void die(const std::string& message);

/**
 * @brief Print message followed by the current errno description.
 */
void logErrno(const std::string& message);
