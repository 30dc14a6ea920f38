#pragma once

#include "outcome.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

// Truncates and writes `body` to directory/filename. Throws BulkdlException.
std::uintmax_t write_file(const std::filesystem::path& directory, const std::string& filename, const std::string& body);

// Stores a downloaded body under the URL's final path segment, overwriting
// any file of that name. Failures become FILESYSTEM_ERROR outcomes.
Outcome write_download(const std::filesystem::path& directory, const std::string& url, const std::string& body);
