#pragma once

#include <stdexcept>
#include <string>

class BulkdlException : public std::runtime_error {
public:
    explicit BulkdlException(const std::string& message)
        : std::runtime_error(message) {}
};
