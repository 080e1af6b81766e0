#pragma once
#include <algorithm>
#include <array>
#include <cinttypes>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "error.hpp"

// Manifest JSON stores binary fields and wide integers as text: every byte is a
// 3 digit zero padded decimal group, multi byte values most significant byte first.
namespace elib::packed {
    constexpr std::size_t GROUP = 3;

    extern auto decode_bytes(std::string_view str) -> std::vector<std::uint8_t>;

    extern auto encode_bytes(std::span<std::uint8_t const> data) -> std::string;

    template <std::size_t N>
    inline auto decode_bytes_n(std::string_view str) -> std::array<std::uint8_t, N> {
        if (str.size() != N * GROUP) [[unlikely]] {
            throw_error(ErrorKind::ManifestCorrupt, __func__, ": str.size() != N * GROUP");
        }
        auto bytes = decode_bytes(str);
        auto result = std::array<std::uint8_t, N>{};
        std::copy_n(bytes.data(), N, result.data());
        return result;
    }

    template <typename T>
        requires(std::is_unsigned_v<T>)
    inline auto decode_uint(std::string_view str) -> T {
        auto bytes = decode_bytes_n<sizeof(T)>(str);
        auto result = T{};
        for (auto b : bytes) {
            result = (T)((result << 8) | b);
        }
        return result;
    }

    template <typename T>
        requires(std::is_unsigned_v<T>)
    inline auto encode_uint(T value) -> std::string {
        auto bytes = std::array<std::uint8_t, sizeof(T)>{};
        for (std::size_t i = sizeof(T); i; --i) {
            bytes[i - 1] = (std::uint8_t)(value & 0xFF);
            value = (T)(value >> 8);
        }
        return encode_bytes(bytes);
    }

    inline auto decode_uint8(std::string_view str) -> std::uint8_t { return decode_uint<std::uint8_t>(str); }

    inline auto decode_uint32(std::string_view str) -> std::uint32_t { return decode_uint<std::uint32_t>(str); }

    inline auto decode_uint64(std::string_view str) -> std::uint64_t { return decode_uint<std::uint64_t>(str); }
}
