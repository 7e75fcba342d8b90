#pragma once

#include <string>

namespace osintpipe::utils {

// Lowercase hex SHA-256 of the raw bytes in `input`.
std::string Sha256Hex(const std::string& input);

bool IsSha256Hex(const std::string& value);

}  // namespace osintpipe::utils
