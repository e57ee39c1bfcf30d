#pragma once

/// @file hash.hpp
/// @brief String hashing helpers for hoard_core

#include <cstddef>
#include <cstdint>
#include <string>

namespace hoard_core {

namespace detail {

/// FNV-1a hash constants
constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

/// Compute FNV-1a hash of string
[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len) noexcept {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

[[nodiscard]] inline std::uint64_t fnv1a_hash(const std::string& str) noexcept {
    return fnv1a_hash(str.data(), str.size());
}

/// Lowercase an ASCII string
[[nodiscard]] inline std::string to_lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return s;
}

} // namespace detail

} // namespace hoard_core
