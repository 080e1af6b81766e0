#pragma once
#include <fmt/args.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cinttypes>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

#include "error.hpp"

#define elib_assert_easy_curl(...)                                                     \
    do {                                                                               \
        if (auto result = __VA_ARGS__; result != CURLE_OK) [[unlikely]] {              \
            auto const kind = ::elib::ErrorKind::Transport;                            \
            ::elib::throw_error(kind, __func__, curl_easy_strerror(result));           \
        }                                                                              \
    } while (false)

namespace elib {
    static std::size_t KiB = 1024;

    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    struct progress_bar {
        static constexpr auto MB = 1024.0 * 1024.0;

        progress_bar(char const* banner,
                     bool disabled,
                     std::uint32_t index,
                     std::uint64_t done,
                     std::uint64_t total) noexcept;
        ~progress_bar() noexcept;

        auto update(std::uint64_t done) noexcept -> void;

    private:
        auto render() const noexcept -> void;

        char const* banner_;
        bool disabled_ = {};
        std::uint32_t index_;
        std::uint64_t done_;
        std::uint64_t total_;
        std::uint64_t percent_;
    };

    extern auto clean_path(std::string path) noexcept -> std::string;

    extern auto to_hex(std::span<std::uint8_t const> data) -> std::string;

    extern auto from_hex(std::string_view str, std::span<std::uint8_t> out) noexcept -> bool;

    inline auto in_range(std::size_t offset, std::size_t size, std::size_t target) noexcept -> bool {
        return offset <= target && target - offset >= size;
    }

    inline auto str_split(std::string_view str, char c) noexcept -> std::pair<std::string_view, std::string_view> {
        if (auto n = str.find(c); n != std::string_view::npos) {
            return {str.substr(0, n), str.substr(n + 1)};
        }
        return {str, {}};
    }

    inline auto str_strip(std::string_view str) noexcept -> std::string_view {
        while (!str.empty() && ::isspace((unsigned char)str.front())) str.remove_prefix(1);
        while (!str.empty() && ::isspace((unsigned char)str.back())) str.remove_suffix(1);
        return str;
    }

    // Splits comma separated list, empty items are dropped.
    extern auto str_list(std::string_view str, char c = ',') -> std::vector<std::string>;
}
