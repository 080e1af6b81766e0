#include "common.hpp"

#include <charconv>
#include <cstdio>
#include <iostream>
#include <utility>

using namespace elib;

elib::progress_bar::progress_bar(char const* banner,
                                 bool disabled,
                                 std::uint32_t index,
                                 std::uint64_t done,
                                 std::uint64_t total) noexcept
    : banner_(banner),
      disabled_(disabled),
      index_(index),
      done_(done),
      total_(std::max(total, std::uint64_t{1})),
      percent_(done_ * 100 / total_) {
    this->render();
}

elib::progress_bar::~progress_bar() noexcept {
    if (!disabled_) {
        this->render();
        std::cerr << std::endl;
    }
}

auto elib::progress_bar::render() const noexcept -> void {
    if (disabled_) {
        return;
    }
    char buffer[128];
    snprintf(buffer, sizeof(buffer), "\r%s #%u: %.02fMB %u%%", banner_, index_, total_ / MB, (std::uint32_t)percent_);
    std::cerr << buffer;
}

auto elib::progress_bar::update(std::uint64_t done) noexcept -> void {
    done_ = done;
    auto percent = std::exchange(percent_, done_ * 100 / total_);
    if (!disabled_ && percent != percent_) {
        this->render();
    }
}

auto elib::clean_path(std::string path) noexcept -> std::string {
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.ends_with('/')) {
        path.pop_back();
    }
    return path;
}

auto elib::to_hex(std::span<std::uint8_t const> data) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(data.size() * 2);
    for (auto c : data) {
        result.push_back(digits[c >> 4]);
        result.push_back(digits[c & 0xF]);
    }
    return result;
}

auto elib::from_hex(std::string_view str, std::span<std::uint8_t> out) noexcept -> bool {
    if (str.size() != out.size() * 2) {
        return false;
    }
    for (std::size_t i = 0; i != out.size(); ++i) {
        auto const beg = str.data() + i * 2;
        auto [p, ec] = std::from_chars(beg, beg + 2, out[i], 16);
        if (ec != std::errc{} || p != beg + 2) {
            return false;
        }
    }
    return true;
}

auto elib::str_list(std::string_view str, char c) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    while (!str.empty()) {
        auto [item, rest] = str_split(str, c);
        if (item = str_strip(item); !item.empty()) {
            result.emplace_back(item);
        }
        str = rest;
    }
    return result;
}
