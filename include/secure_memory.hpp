#pragma once

#include <cstddef>
#include <string>

#include <sodium.h>

namespace fd {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Wipes the characters in place, then empties the string.
inline void secureWipe(std::string& value) {
    if (!value.empty()) {
        secureZero(&value[0], value.size());
    }
    value.clear();
}

} // namespace fd
