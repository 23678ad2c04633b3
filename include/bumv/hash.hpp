#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace bumv {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * SHA-1 of a byte string. Fingerprints a rendered snapshot and seeds
 * temporary names; not a security boundary.
 */
digest sha1(std::string_view data);

// 40-char lowercase hex
std::string to_hex(const digest &d);

inline std::string sha1_hex(std::string_view data) { return to_hex(sha1(data)); }

} // namespace bumv
