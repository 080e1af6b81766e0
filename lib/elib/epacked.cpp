#include "epacked.hpp"

#include <fmt/format.h>

using namespace elib;

auto packed::decode_bytes(std::string_view str) -> std::vector<std::uint8_t> {
    elib_check(ErrorKind::ManifestCorrupt, str.size() % GROUP == 0);
    auto result = std::vector<std::uint8_t>{};
    result.reserve(str.size() / GROUP);
    for (std::size_t i = 0; i != str.size(); i += GROUP) {
        auto value = 0u;
        for (auto c : str.substr(i, GROUP)) {
            if (c < '0' || c > '9') [[unlikely]] {
                elib_raise(ErrorKind::ManifestCorrupt, fmt::format(": bad digit in packed field: {}", str).c_str());
            }
            value = value * 10 + (unsigned)(c - '0');
        }
        elib_check(ErrorKind::ManifestCorrupt, value <= 0xFFu);
        result.push_back((std::uint8_t)value);
    }
    return result;
}

auto packed::encode_bytes(std::span<std::uint8_t const> data) -> std::string {
    auto result = std::string{};
    result.reserve(data.size() * GROUP);
    for (auto b : data) {
        result += fmt::format("{:03d}", b);
    }
    return result;
}
