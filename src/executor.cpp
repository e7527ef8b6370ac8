#include "codepair/executor.h"

namespace codepair {

size_t code_length(const std::string& code) {
    size_t units = 0;
    for (unsigned char c : code) {
        if ((c & 0xC0) == 0x80) continue;   // continuation byte
        units += c >= 0xF0 ? 2 : 1;         // 4-byte sequences are surrogate pairs
    }
    return units;
}

} // namespace codepair
