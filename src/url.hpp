#pragma once

#include <string>

// True for absolute http/https URLs with a non-empty host. Pure, no I/O.
bool is_valid_url(const std::string& url);

// Text after the last '/' of the URL. Empty when the URL ends with '/'.
std::string url_filename(const std::string& url);
