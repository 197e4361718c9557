#pragma once

#include <string>

// Lower-case hex SHA-256 of a file. Throws std::runtime_error when the file
// cannot be read.
std::string sha256File(const std::string& path);
std::string sha256Hex(const std::string& data);
