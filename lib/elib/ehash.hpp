#pragma once
#include <array>
#include <cinttypes>
#include <optional>
#include <span>
#include <string>

#include "common.hpp"

namespace elib {
    using SHA1 = std::array<std::uint8_t, 20>;

    extern auto sha1(std::span<char const> data) noexcept -> SHA1;

    // Hashes whole file, nullopt when it can not be opened or read.
    extern auto sha1_file(fs::path const& path) noexcept -> std::optional<SHA1>;

    inline auto is_zero(SHA1 const& hash) noexcept -> bool {
        return std::all_of(hash.begin(), hash.end(), [](std::uint8_t c) { return c == 0; });
    }
}
