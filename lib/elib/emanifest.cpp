#include "emanifest.hpp"

#ifndef JS_STD_UNORDERED_MAP
#    define JS_STD_UNORDERED_MAP 1
#endif
#include <json_struct/json_struct.h>

#include <unordered_set>

#include "epacked.hpp"
#include "iofile.hpp"

using namespace elib;

struct EMAN::Raw {
    using Table = std::unordered_map<std::string, std::string>;

    struct Part {
        std::string Guid;
        std::string Offset;
        std::string Size;

        JS_OBJ(Guid, Offset, Size);
    };

    struct File {
        std::string Filename;
        std::string FileHash;
        std::vector<Part> FileChunkParts;
        std::vector<std::string> InstallTags;
        bool bIsUnixExecutable = {};
        bool bIsReadOnly = {};

        JS_OBJ(Filename, FileHash, FileChunkParts, InstallTags, bIsUnixExecutable, bIsReadOnly);
    };

    std::string AppNameString;
    std::string BuildVersionString;
    std::string LaunchExeString;
    std::string LaunchCommand;
    std::vector<File> FileManifestList;
    Table ChunkHashList;
    Table ChunkShaList;
    Table DataGroupList;
    Table ChunkFilesizeList;

    JS_OBJ(AppNameString,
           BuildVersionString,
           LaunchExeString,
           LaunchCommand,
           FileManifestList,
           ChunkHashList,
           ChunkShaList,
           DataGroupList,
           ChunkFilesizeList);

    static auto parse_guid(std::string_view str) -> ChunkGUID {
        auto guid = ChunkGUID::parse(str);
        if (!guid) [[unlikely]] {
            elib_raise(ErrorKind::ManifestCorrupt, fmt::format(": bad chunk guid: {}", str).c_str());
        }
        return *guid;
    }

    static auto index(Table const& table) -> std::unordered_map<ChunkGUID, std::string_view> {
        auto result = std::unordered_map<ChunkGUID, std::string_view>{};
        result.reserve(table.size());
        for (auto const& [key, value] : table) {
            result[parse_guid(key)] = value;
        }
        return result;
    }

    static auto lookup(std::unordered_map<ChunkGUID, std::string_view> const& table,
                       ChunkGUID const& guid,
                       char const* name) -> std::string_view {
        auto i = table.find(guid);
        if (i == table.end()) [[unlikely]] {
            elib_raise(ErrorKind::ManifestCorrupt, fmt::format(": chunk {} missing from {}", guid, name).c_str());
        }
        return i->second;
    }

    auto to_file(File const& raw) const -> EFile {
        elib_trace("file: %s", raw.Filename.c_str());
        elib_check(ErrorKind::ManifestCorrupt, !raw.Filename.empty());
        auto file = EFile{
            .name = raw.Filename,
            .hash = packed::decode_bytes_n<20>(raw.FileHash),
            .parts = {},
            .install_tags = raw.InstallTags,
            .executable = raw.bIsUnixExecutable,
            .read_only = raw.bIsReadOnly,
        };
        file.parts.reserve(raw.FileChunkParts.size());
        for (auto const& part : raw.FileChunkParts) {
            file.parts.push_back(EChunk::Part{
                .guid = parse_guid(part.Guid),
                .offset = packed::decode_uint32(part.Offset),
                .size = packed::decode_uint32(part.Size),
            });
        }
        return file;
    }

    auto to_chunks(std::vector<EFile> const& files) const -> std::unordered_map<ChunkGUID, EChunk> {
        auto const hashes = index(ChunkHashList);
        auto const shas = index(ChunkShaList);
        auto const groups = index(DataGroupList);
        auto const sizes = index(ChunkFilesizeList);
        auto result = std::unordered_map<ChunkGUID, EChunk>{};
        for (auto const& file : files) {
            for (auto const& part : file.parts) {
                if (result.contains(part.guid)) {
                    continue;
                }
                elib_trace("chunk: %s", part.guid.str().c_str());
                auto chunk = EChunk{
                    .guid = part.guid,
                    .hash = packed::decode_uint64(lookup(hashes, part.guid, "ChunkHashList")),
                    .sha1 = {},
                    .data_group = packed::decode_uint8(lookup(groups, part.guid, "DataGroupList")),
                    .file_size = packed::decode_uint64(lookup(sizes, part.guid, "ChunkFilesizeList")),
                };
                elib_check(ErrorKind::ManifestCorrupt,
                           from_hex(lookup(shas, part.guid, "ChunkShaList"), chunk.sha1));
                result.emplace(part.guid, chunk);
            }
        }
        return result;
    }
};

auto EFile::size() const noexcept -> std::uint64_t {
    auto result = std::uint64_t{};
    for (auto const& part : parts) {
        result += part.size;
    }
    return result;
}

auto EMAN::Filter::operator()(EFile const& file) const noexcept -> bool {
    if (names.empty()) {
        return true;
    }
    return std::find(names.begin(), names.end(), file.name) != names.end();
}

auto EMAN::read(std::span<char const> data) -> EMAN {
    auto raw = Raw{};
    auto context = JS::ParseContext(data.data(), data.size());
    context.allow_missing_members = true;
    context.allow_unnasigned_required_members = true;
    if (auto error = context.parseTo(raw); error != JS::Error::NoError) [[unlikely]] {
        elib_raise(ErrorKind::ManifestCorrupt, (": " + context.makeErrorString()).c_str());
    }

    auto result = EMAN{
        .app_name = raw.AppNameString,
        .build_version = raw.BuildVersionString,
        .launch_exe = raw.LaunchExeString,
        .launch_command = raw.LaunchCommand,
        .files = {},
        .chunks = {},
    };
    auto names = std::unordered_set<std::string>{};
    result.files.reserve(raw.FileManifestList.size());
    for (auto const& rawfile : raw.FileManifestList) {
        auto file = raw.to_file(rawfile);
        if (!names.insert(file.name).second) [[unlikely]] {
            elib_raise(ErrorKind::ManifestCorrupt, fmt::format(": duplicate file name: {}", file.name).c_str());
        }
        result.files.push_back(std::move(file));
    }
    result.chunks = raw.to_chunks(result.files);
    return result;
}

auto EMAN::read_file(fs::path const& path) -> EMAN {
    elib_trace("manifest: %s", path.generic_string().c_str());
    auto infile = IO::File(path, IO::READ);
    return EMAN::read(infile.copy(0, infile.size()));
}

auto EMAN::filter(Filter const& filter) -> void {
    files.erase(std::remove_if(files.begin(), files.end(), [&](EFile const& file) { return !filter(file); }),
                files.end());
}

auto EMAN::chunk(ChunkGUID const& guid) const -> EChunk const& {
    auto i = chunks.find(guid);
    if (i == chunks.end()) [[unlikely]] {
        elib_raise(ErrorKind::ManifestCorrupt, fmt::format(": unknown chunk {}", guid).c_str());
    }
    return i->second;
}
