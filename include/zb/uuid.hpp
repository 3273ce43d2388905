#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace zb {

// Random v4 UUID, used to name staging directories and partial downloads
// so concurrent runs never collide.
struct Uuid {
    std::array<uint8_t, 16> bytes;

    static Uuid v4();
    std::string to_string() const;

    // 16 hex chars, enough for a temp-file suffix
    std::string short_hex() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

} // namespace zb
