#include "codepair/ids.h"
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace codepair {

std::string random_id(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string id;
    id.reserve(bytes * 2);
    for (unsigned char b : buffer) {
        id += hex[b >> 4];
        id += hex[b & 0x0F];
    }
    return id;
}

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

} // namespace codepair
