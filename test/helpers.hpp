#pragma once
#include <miniz.h>

#include <elib/buffer.hpp>
#include <elib/common.hpp>
#include <elib/ecdn.hpp>
#include <elib/echunk.hpp>
#include <elib/ehash.hpp>
#include <elib/emanifest.hpp>
#include <elib/iofile.hpp>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace elib::test {
    inline auto guid(std::uint32_t n) -> ChunkGUID { return ChunkGUID{{0x11111111u, 0x22222222u, 0x33333333u, n}}; }

    inline auto to_buffer(std::span<char const> data) -> Buffer {
        auto result = Buffer{};
        elib_assert(result.append(data));
        return result;
    }

    inline auto to_string(IO const& io) -> std::string {
        auto data = io.copy(0, io.size());
        return std::string(data.data(), data.size());
    }

    inline auto deflate(std::string_view data) -> std::string {
        auto size = mz_compressBound((mz_ulong)data.size());
        auto result = std::string(size, '\0');
        auto status = mz_compress((unsigned char*)result.data(), &size, (unsigned char const*)data.data(), data.size());
        elib_assert(status == MZ_OK);
        result.resize(size);
        return result;
    }

    // Serialized chunk blob as served by the cdn.
    inline auto make_blob(ChunkGUID const& id,
                          std::string_view payload,
                          std::uint8_t stored_as = EChunk::COMPRESSED,
                          std::uint32_t version = 3) -> std::string {
        auto const body = stored_as == EChunk::COMPRESSED ? deflate(payload) : std::string(payload);
        auto header = EChunk::Header{
            .magic = EChunk::Header::MAGIC,
            .version = version,
            .header_size = 0,
            .data_size = (std::uint32_t)body.size(),
            .guid = id,
            .rolling_hash = 0x0123456789ABCDEFull,
            .stored_as = stored_as,
            .sha1 = sha1(payload),
            .hash_type = 2,
            .data_size_uncompressed = (std::uint32_t)payload.size(),
        };
        return to_string(header.write()) + body;
    }

    // Serves prebuilt chunk blobs and counts fetches per guid.
    struct MemorySource final : ChunkSource {
        std::unordered_map<ChunkGUID, std::string> blobs = {};
        std::unordered_map<ChunkGUID, std::size_t> fetches = {};

        auto fetch(EChunk const& chunk) -> Buffer override {
            ++fetches[chunk.guid];
            auto i = blobs.find(chunk.guid);
            if (i == blobs.end()) {
                elib_raise(ErrorKind::Transport, ": http status 404");
            }
            return chunk.extract(to_buffer(i->second));
        }

        auto total() const noexcept -> std::size_t {
            auto result = std::size_t{};
            for (auto const& [_, count] : fetches) {
                result += count;
            }
            return result;
        }
    };

    // Builds manifests in memory, chunk metadata is derived from the payloads.
    struct ManifestBuilder {
        EMAN manifest = {};
        MemorySource source = {};

        auto chunk(ChunkGUID const& id, std::string_view payload, std::uint8_t stored_as = EChunk::COMPRESSED)
            -> ManifestBuilder& {
            source.blobs[id] = make_blob(id, payload, stored_as);
            manifest.chunks[id] = EChunk{
                .guid = id,
                .hash = 0x0123456789ABCDEFull,
                .sha1 = sha1(payload),
                .data_group = 7,
                .file_size = source.blobs[id].size(),
            };
            return *this;
        }

        auto file(std::string name, std::string_view content, std::vector<EChunk::Part> parts) -> ManifestBuilder& {
            manifest.files.push_back(EFile{
                .name = std::move(name),
                .hash = sha1(content),
                .parts = std::move(parts),
                .install_tags = {},
                .executable = false,
                .read_only = false,
            });
            return *this;
        }
    };

    // Fresh directory removed on destruction.
    struct TempDir {
        TempDir() {
            auto rng = std::random_device{};
            path = fs::temp_directory_path() / fmt::format("eman-test-{:08x}{:08x}", rng(), rng());
            fs::create_directories(path);
        }
        TempDir(TempDir const&) = delete;
        ~TempDir() noexcept {
            auto ec = std::error_code{};
            fs::remove_all(path, ec);
        }

        fs::path path;
    };

    inline auto read_text(fs::path const& path) -> std::string {
        auto infile = IO::File(path, IO::READ);
        return to_string(infile);
    }

    inline auto write_text(fs::path const& path, std::string_view text) -> void {
        auto outfile = IO::File(path, IO::WRITE | IO::TRUNCATE);
        elib_assert(outfile.write(0, text));
    }
}
