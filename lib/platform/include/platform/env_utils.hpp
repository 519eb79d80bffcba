#pragma once

#include <string>

namespace tidepool::platform {

/**
 * @brief Returns the user's home directory, or an empty string when unknown.
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Expands a leading "~/" to the home directory.
 *
 * @param path Path possibly starting with ~
 * @return Expanded path, or the input unchanged
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/**
 * @brief Reads a whole text file and strips surrounding whitespace.
 *
 * @param path File to read (tilde expanded)
 * @return File contents
 * @throws std::runtime_error if the file cannot be opened
 */
[[nodiscard]] auto read_trimmed_file(const std::string &path) -> std::string;

}// namespace tidepool::platform
