#pragma once

#include "exception.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Per-completion progress marker on stdout. log_progress_end() closes the marker line.
void log_progress_tick();
void log_progress_end();

// Filesystem utilities
bool is_writable_dir(const fs::path& path);
// Every line of the file in order, trailing '\r' removed. Blank lines are kept.
std::vector<std::string> read_lines_from_file(const fs::path& path);
