#pragma once

#include "julesbot/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace julesbot::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);

/// Split on runs of whitespace. With max_splits > 0 the last element keeps the
/// untouched remainder of the input, so "/create a/b fix the bug" split with
/// max_splits = 2 yields {"/create", "a/b", "fix the bug"}.
[[nodiscard]] std::vector<std::string> split_words(const std::string &input,
                                                   std::size_t max_splits = 0);

[[nodiscard]] bool is_all_digits(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Append one line (a newline is added) to a file, creating parent directories.
[[nodiscard]] Status append_line(const std::filesystem::path &path, const std::string &line);

/// UTC timestamp such as 2024-05-01T12:30:05.123Z.
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point when);

} // namespace julesbot::common
