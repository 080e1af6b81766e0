#include <gtest/gtest.h>

#include "helpers.hpp"

using namespace elib;
using namespace elib::test;

template <typename Func>
static auto error_kind_of(Func&& func) -> std::optional<ErrorKind> {
    try {
        func();
    } catch (Error const& error) {
        error_stack().clear();
        return error.kind();
    }
    return std::nullopt;
}

TEST(ChunkGUID, ParsesAndPrintsUppercaseHex) {
    auto parsed = ChunkGUID::parse("0123456789abcdef0123456789ABCDEF");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->words[0], 0x01234567u);
    EXPECT_EQ(parsed->words[3], 0x89ABCDEFu);
    EXPECT_EQ(parsed->str(), "0123456789ABCDEF0123456789ABCDEF");
    EXPECT_FALSE(ChunkGUID::parse("0123"));
    EXPECT_FALSE(ChunkGUID::parse("0123456789abcdef0123456789ABCDEX"));
}

TEST(Chunk, PathUsesGroupHashAndGuid) {
    auto chunk = EChunk{
        .guid = guid(0xAABBCCDD),
        .hash = 0x1234u,
        .sha1 = {},
        .data_group = 5,
        .file_size = 0,
    };
    EXPECT_EQ(chunk.path(), "ChunksV3/05/0000000000001234_111111112222222233333333AABBCCDD.chunk");
}

TEST(ChunkHeader, ParsesLittleEndianFields) {
    auto const blob = make_blob(guid(1), "HelloWorld", EChunk::RAW);
    auto header = EChunk::Header::read(to_buffer(blob));
    EXPECT_EQ(header.magic, EChunk::Header::MAGIC);
    EXPECT_EQ(header.version, 3u);
    EXPECT_EQ(header.header_size, EChunk::Header::SIZE_V3);
    EXPECT_EQ(header.data_size, 10u);
    EXPECT_EQ(header.guid, guid(1));
    EXPECT_EQ(header.rolling_hash, 0x0123456789ABCDEFull);
    EXPECT_EQ(header.stored_as, EChunk::RAW);
    EXPECT_EQ(header.sha1, sha1(std::string_view("HelloWorld")));
    EXPECT_EQ(header.data_size_uncompressed, 10u);
    EXPECT_EQ((std::uint8_t)blob[0], 0xA2);
    EXPECT_EQ((std::uint8_t)blob[3], 0xB1);
}

TEST(ChunkHeader, UsesHeaderSizeFromBlob) {
    auto header = EChunk::Header{
        .magic = EChunk::Header::MAGIC,
        .version = 1,
        .header_size = 48,
        .data_size = 5,
        .guid = guid(2),
        .stored_as = EChunk::RAW,
    };
    auto const blob = to_string(header.write()) + "Hello";
    ASSERT_EQ(blob.size(), 53u);
    auto decoded = EChunk::decode(to_buffer(blob));
    EXPECT_EQ(decoded.header.header_size, 48u);
    EXPECT_EQ(to_string(decoded.payload), "Hello");
}

TEST(ChunkHeader, OlderVersionsHaveShorterLayout) {
    auto v1 = make_blob(guid(3), "abc", EChunk::RAW, 1);
    auto v2 = make_blob(guid(3), "abc", EChunk::RAW, 2);
    EXPECT_EQ(v1.size(), EChunk::Header::SIZE_V1 + 3);
    EXPECT_EQ(v2.size(), EChunk::Header::SIZE_V2 + 3);
    EXPECT_EQ(to_string(EChunk::decode(to_buffer(v1)).payload), "abc");
    EXPECT_EQ(EChunk::decode(to_buffer(v2)).header.sha1, sha1(std::string_view("abc")));
}

TEST(ChunkHeader, RejectsTruncatedAndForeignBlobs) {
    auto blob = make_blob(guid(4), "HelloWorld", EChunk::RAW);
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(std::string_view(blob).substr(0, 40))); }),
              ErrorKind::ChunkHeaderTruncated);
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(std::string_view(blob).substr(0, 50))); }),
              ErrorKind::ChunkHeaderTruncated);
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(std::string_view(blob).substr(0, 70))); }),
              ErrorKind::ChunkCorrupt);
    auto foreign = blob;
    foreign[0] = 'X';
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(foreign)); }), ErrorKind::ChunkCorrupt);
}

TEST(ChunkDecode, RawPayloadIsReturnedAsIs) {
    auto decoded = EChunk::decode(to_buffer(make_blob(guid(5), "HelloWorld", EChunk::RAW)));
    EXPECT_EQ(to_string(decoded.payload), "HelloWorld");
}

TEST(ChunkDecode, CompressedPayloadIsInflated) {
    auto const payload = std::string(200000, 'z') + "tail";
    auto const blob = make_blob(guid(6), payload, EChunk::COMPRESSED);
    EXPECT_LT(blob.size(), payload.size());
    auto decoded = EChunk::decode(to_buffer(blob));
    EXPECT_EQ(to_string(decoded.payload), payload);
}

TEST(ChunkDecode, UnknownEncodingIsRejected) {
    auto const blob = make_blob(guid(7), "HelloWorld", 7);
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(blob)); }), ErrorKind::UnknownChunkEncoding);
}

TEST(ChunkDecode, TruncatedCompressedStreamIsCorrupt) {
    auto const blob = make_blob(guid(8), std::string(4096, 'q') + "HelloWorld", EChunk::COMPRESSED, 2);
    auto header = EChunk::Header::read(to_buffer(blob));
    auto cut = header;
    cut.data_size = header.data_size / 2;
    auto const body = std::string_view(blob).substr(header.header_size, cut.data_size);
    auto const truncated = to_string(cut.write()) + std::string(body);
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(truncated)); }), ErrorKind::ChunkCorrupt);
}

TEST(ChunkExtract, ChecksGuidAndSha1) {
    auto chunk = EChunk{
        .guid = guid(9),
        .hash = 0,
        .sha1 = sha1(std::string_view("HelloWorld")),
        .data_group = 0,
        .file_size = 0,
    };
    EXPECT_EQ(to_string(chunk.extract(to_buffer(make_blob(guid(9), "HelloWorld")))), "HelloWorld");
    EXPECT_EQ(error_kind_of([&] { chunk.extract(to_buffer(make_blob(guid(10), "HelloWorld"))); }),
              ErrorKind::ChunkCorrupt);
    EXPECT_EQ(error_kind_of([&] { chunk.extract(to_buffer(make_blob(guid(9), "HelloWorle"))); }),
              ErrorKind::ChunkCorrupt);
    chunk.sha1 = {};
    EXPECT_EQ(to_string(chunk.extract(to_buffer(make_blob(guid(9), "anything")))), "anything");
}

TEST(ChunkDecode, OversizedUncompressedSizeIsCorrupt) {
    auto const body = deflate("HelloWorld");
    auto header = EChunk::Header{
        .magic = EChunk::Header::MAGIC,
        .version = 3,
        .data_size = (std::uint32_t)body.size(),
        .guid = guid(11),
        .stored_as = EChunk::COMPRESSED,
        .data_size_uncompressed = 0xFFFFFFF0u,
    };
    auto const blob = to_string(header.write()) + body;
    EXPECT_EQ(error_kind_of([&] { EChunk::decode(to_buffer(blob)); }), ErrorKind::ChunkCorrupt);
}
