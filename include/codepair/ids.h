#pragma once

#include <string>
#include <cstddef>

namespace codepair {

// Hex string of `bytes` random bytes from OpenSSL's CSPRNG.
// Throws std::runtime_error if the generator fails.
std::string random_id(size_t bytes);

// Standard base64 (used for the WebSocket accept key)
std::string base64_encode(const unsigned char* data, size_t len);

} // namespace codepair
