#include "ehash.hpp"

#include <digestpp.hpp>

#include "iofile.hpp"

using namespace elib;

auto elib::sha1(std::span<char const> data) noexcept -> SHA1 {
    auto result = SHA1{};
    digestpp::sha1().absorb((std::uint8_t const*)data.data(), data.size()).digest(result.data(), result.size());
    return result;
}

auto elib::sha1_file(fs::path const& path) noexcept -> std::optional<SHA1> {
    constexpr std::size_t CHUNK = 1 * 1024 * 1024;
    auto const depth = error_stack().size();
    try {
        if (!fs::is_regular_file(path)) {
            return std::nullopt;
        }
        auto infile = IO::File(path, IO::READ);
        auto hasher = digestpp::sha1();
        auto buffer = std::vector<char>(std::min(CHUNK, std::max(infile.size(), std::size_t{1})));
        for (std::size_t offset = 0; offset != infile.size();) {
            auto const count = std::min(buffer.size(), infile.size() - offset);
            if (!infile.read(offset, {buffer.data(), count})) {
                return std::nullopt;
            }
            hasher.absorb((std::uint8_t const*)buffer.data(), count);
            offset += count;
        }
        auto result = SHA1{};
        hasher.digest(result.data(), result.size());
        return result;
    } catch (std::exception const&) {
        error_stack().resize(depth);
        return std::nullopt;
    }
}
