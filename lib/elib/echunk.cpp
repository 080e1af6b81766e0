#include "echunk.hpp"

#include <miniz.h>

#include <charconv>
#include <memory>

#include "common.hpp"

using namespace elib;

static auto mz_message(int status) noexcept -> char const* {
    auto msg = mz_error(status);
    return msg ? msg : "unknown error";
}

struct ChunkInflate : mz_stream {
    ChunkInflate() : mz_stream{} {
        if (auto status = mz_inflateInit(this); status != MZ_OK) [[unlikely]] {
            throw_error(ErrorKind::ChunkCorrupt, "mz_inflateInit: ", mz_message(status));
        }
    }
    ChunkInflate(ChunkInflate const&) = delete;
    ~ChunkInflate() noexcept { mz_inflateEnd(this); }

    auto run(std::span<char const> src, std::size_t size_hint) -> Buffer {
        auto result = Buffer{};
        auto const initial = std::clamp(size_hint, std::size_t{64 * 1024}, EChunk::LIMIT);
        elib_check(ErrorKind::ChunkCorrupt, result.resize_keep(initial));
        this->next_in = (unsigned char const*)src.data();
        this->avail_in = (unsigned int)src.size();
        for (;;) {
            auto const done = (std::size_t)this->total_out;
            if (done == result.size()) {
                elib_check(ErrorKind::ChunkCorrupt, result.size() <= EChunk::LIMIT);
                elib_check(ErrorKind::ChunkCorrupt, result.resize_keep(result.size() * 2));
            }
            this->next_out = (unsigned char*)result.data() + done;
            this->avail_out = (unsigned int)(result.size() - done);
            auto const status = mz_inflate(this, MZ_NO_FLUSH);
            if (status == MZ_STREAM_END) {
                break;
            }
            if (status == MZ_BUF_ERROR && this->avail_in == 0 && this->avail_out != 0) [[unlikely]] {
                elib_raise(ErrorKind::ChunkCorrupt, ": compressed stream is truncated");
            }
            if (status != MZ_OK && status != MZ_BUF_ERROR) [[unlikely]] {
                throw_error(ErrorKind::ChunkCorrupt, "mz_inflate: ", mz_message(status));
            }
        }
        elib_check(ErrorKind::ChunkCorrupt, result.resize_keep((std::size_t)this->total_out));
        return result;
    }
};

auto ChunkGUID::parse(std::string_view str) noexcept -> std::optional<ChunkGUID> {
    if (str.size() != 32) {
        return std::nullopt;
    }
    auto result = ChunkGUID{};
    for (std::size_t i = 0; i != 4; ++i) {
        auto const beg = str.data() + i * 8;
        auto const end = beg + 8;
        auto [p, ec] = std::from_chars(beg, end, result.words[i], 16);
        if (ec != std::errc{} || p != end) {
            return std::nullopt;
        }
    }
    return result;
}

auto ChunkGUID::str() const -> std::string {
    return fmt::format("{:08X}{:08X}{:08X}{:08X}", words[0], words[1], words[2], words[3]);
}

auto EChunk::path() const -> std::string {
    return fmt::format("ChunksV3/{:02d}/{:016X}_{}.chunk", (unsigned)data_group, hash, guid);
}

auto EChunk::Header::layout_size(std::uint32_t version) noexcept -> std::size_t {
    if (version >= 3) {
        return SIZE_V3;
    }
    if (version == 2) {
        return SIZE_V2;
    }
    return SIZE_V1;
}

auto EChunk::Header::read(IO const& io) -> Header {
    auto reader = IO::Reader(io);
    auto header = Header{};
    elib_check(ErrorKind::ChunkHeaderTruncated, reader.remains() >= SIZE_V1);
    elib_assert(reader.read(header.magic));
    elib_assert(reader.read(header.version));
    elib_assert(reader.read(header.header_size));
    elib_assert(reader.read(header.data_size));
    elib_assert(reader.read(std::span<std::uint32_t>(header.guid.words)));
    elib_assert(reader.read(header.rolling_hash));
    elib_assert(reader.read(header.stored_as));
    elib_check(ErrorKind::ChunkCorrupt, header.magic == MAGIC);
    elib_check(ErrorKind::ChunkCorrupt, header.version >= 1);
    elib_check(ErrorKind::ChunkCorrupt, header.header_size >= layout_size(header.version));
    elib_check(ErrorKind::ChunkHeaderTruncated, reader.size() >= header.header_size);
    if (header.version >= 2) {
        elib_assert(reader.read(std::span<std::uint8_t>(header.sha1)));
        elib_assert(reader.read(header.hash_type));
    }
    if (header.version >= 3) {
        elib_assert(reader.read(header.data_size_uncompressed));
    }
    return header;
}

auto EChunk::Header::write() const -> Buffer {
    auto result = Buffer{};
    auto const size = std::max((std::size_t)header_size, layout_size(version));
    elib_assert(result.resize_keep(size));
    std::memset(result.data(), 0, size);
    auto out = result.data();
    auto put = [&out](auto const& value) {
        std::memcpy(out, &value, sizeof(value));
        out += sizeof(value);
    };
    put(magic);
    put(version);
    put((std::uint32_t)size);
    put(data_size);
    put(guid.words);
    put(rolling_hash);
    put(stored_as);
    if (version >= 2) {
        put(sha1);
        put(hash_type);
    }
    if (version >= 3) {
        put(data_size_uncompressed);
    }
    return result;
}

auto EChunk::decode(IO const& blob) -> Decoded {
    auto result = Decoded{.header = Header::read(blob)};
    auto const& header = result.header;
    if (header.stored_as != RAW && header.stored_as != COMPRESSED) [[unlikely]] {
        elib_raise(ErrorKind::UnknownChunkEncoding,
                   fmt::format(": stored_as = {} for chunk {}", (unsigned)header.stored_as, header.guid).c_str());
    }
    elib_check(ErrorKind::ChunkCorrupt, in_range(header.header_size, header.data_size, blob.size()));
    elib_check(ErrorKind::ChunkCorrupt, header.data_size_uncompressed <= LIMIT);
    auto src = blob.copy(header.header_size, header.data_size);
    if (header.stored_as == COMPRESSED) {
        result.payload = ChunkInflate{}.run(src, header.data_size_uncompressed);
    } else {
        elib_check(ErrorKind::ChunkCorrupt, result.payload.append(src));
    }
    if (header.version >= 3) {
        elib_check(ErrorKind::ChunkCorrupt, result.payload.size() == header.data_size_uncompressed);
    }
    return result;
}

auto EChunk::extract(IO const& blob) const -> Buffer {
    elib_trace("chunk: %s", guid.str().c_str());
    auto decoded = EChunk::decode(blob);
    if (decoded.header.guid != guid) [[unlikely]] {
        elib_raise(ErrorKind::ChunkCorrupt, fmt::format(": header guid is {}", decoded.header.guid).c_str());
    }
    if (!is_zero(sha1)) {
        auto const actual = elib::sha1(decoded.payload);
        if (actual != sha1) [[unlikely]] {
            elib_raise(ErrorKind::ChunkCorrupt,
                       fmt::format(": payload sha1 is {} want {}", to_hex(actual), to_hex(sha1)).c_str());
        }
    }
    return std::move(decoded.payload);
}
