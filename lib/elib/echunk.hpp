#pragma once
#include <array>
#include <cinttypes>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "buffer.hpp"
#include "common.hpp"
#include "ehash.hpp"

namespace elib {
    struct ChunkGUID {
        std::array<std::uint32_t, 4> words = {};

        // 32 hex digits, case insensitive.
        static auto parse(std::string_view str) noexcept -> std::optional<ChunkGUID>;

        auto str() const -> std::string;

        auto empty() const noexcept -> bool { return words == std::array<std::uint32_t, 4>{}; }

        auto operator<=>(ChunkGUID const&) const noexcept = default;
    };

    struct EChunk {
        static constexpr std::size_t LIMIT = 256u * 1024 * 1024 - 1;

        ChunkGUID guid;
        std::uint64_t hash;
        SHA1 sha1;
        std::uint8_t data_group;
        std::uint64_t file_size;

        // Location of chunk relative to cdn base url.
        auto path() const -> std::string;

        struct Part;
        struct Header;
        struct Decoded;

        enum StoredAs : std::uint8_t {
            RAW = 0,
            COMPRESSED = 1,
        };

        // Parses header and returns decompressed payload.
        static auto decode(IO const& blob) -> Decoded;

        // Decodes blob downloaded for this chunk and checks it against manifest.
        auto extract(IO const& blob) const -> Buffer;
    };

    struct EChunk::Part {
        ChunkGUID guid;
        std::uint32_t offset;
        std::uint32_t size;
    };

    struct EChunk::Header {
        static constexpr std::uint32_t MAGIC = 0xB1FE3AA2u;
        static constexpr std::size_t SIZE_V1 = 41;
        static constexpr std::size_t SIZE_V2 = 62;
        static constexpr std::size_t SIZE_V3 = 66;

        std::uint32_t magic = {};
        std::uint32_t version = {};
        std::uint32_t header_size = {};
        std::uint32_t data_size = {};
        ChunkGUID guid = {};
        std::uint64_t rolling_hash = {};
        std::uint8_t stored_as = {};
        SHA1 sha1 = {};
        std::uint8_t hash_type = {};
        std::uint32_t data_size_uncompressed = {};

        static auto layout_size(std::uint32_t version) noexcept -> std::size_t;

        static auto read(IO const& io) -> Header;

        // Serialized form, header_size bytes long.
        auto write() const -> Buffer;
    };

    struct EChunk::Decoded {
        Header header;
        Buffer payload;
    };
}

template <>
struct std::hash<elib::ChunkGUID> {
    auto operator()(elib::ChunkGUID const& guid) const noexcept -> std::size_t {
        auto const lo = ((std::uint64_t)guid.words[0] << 32) | guid.words[1];
        auto const hi = ((std::uint64_t)guid.words[2] << 32) | guid.words[3];
        return std::hash<std::uint64_t>{}(lo ^ (hi * 0x9E3779B97F4A7C15ull));
    }
};

template <>
struct fmt::formatter<elib::ChunkGUID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(elib::ChunkGUID const& guid, FormatContext& ctx) const {
        return formatter<std::string>::format(guid.str(), ctx);
    }
};
