#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace mmig {

// Lowercase hex of a byte buffer.
std::string to_hex(const uint8_t* data, size_t len);

// Random RFC 4122 version 4 identifier.
std::string uuid4();

} // namespace mmig
