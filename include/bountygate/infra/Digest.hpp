#pragma once

#include <string>

namespace bountygate {

// Lower-case hex SHA-256 of the input bytes. Throws std::runtime_error when
// the OpenSSL digest context cannot be created.
std::string sha256_hex(const std::string& data);

} // namespace bountygate
