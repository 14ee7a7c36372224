#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, config-relative paths, file checks
 */

#include <string>
#include <cstdint>

namespace taco {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolves a relative path against base_dir (after ~ expansion). Absolute paths are returned as-is.
 */
std::string resolve_path(const std::string& path, const std::string& base_dir);

/**
 * Directory containing the running executable (/proc/self/exe), or "." if unavailable.
 */
std::string executable_dir();

/**
 * Size of a regular file in bytes; 0 when missing or unreadable.
 */
uint64_t file_size_or_zero(const std::string& path);

/**
 * Platform suffix used by Porcupine keyword files:
 * "linux-x86_64", "raspberry-pi" (arm/aarch64), "mac".
 */
std::string keyword_platform_suffix();

} // namespace taco
