#pragma once
#include <string>
#include <string_view>

namespace mmig {

// SHA-256 of a buffer as 64 lowercase hex characters.
// Throws std::runtime_error if the OpenSSL digest context fails.
std::string sha256_hex(std::string_view bytes);

} // namespace mmig
