#pragma once
#include <cinttypes>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"
#include "echunk.hpp"
#include "ehash.hpp"

namespace elib {
    struct EFile {
        std::string name;
        SHA1 hash;
        std::vector<EChunk::Part> parts;
        std::vector<std::string> install_tags;
        bool executable;
        bool read_only;

        auto size() const noexcept -> std::uint64_t;
    };

    struct EMAN {
        std::string app_name;
        std::string build_version;
        std::string launch_exe;
        std::string launch_command;
        std::vector<EFile> files;
        std::unordered_map<ChunkGUID, EChunk> chunks;

        // Exact, case sensitive allow-list of file names, empty allows everything.
        struct Filter {
            std::vector<std::string> names;

            auto operator()(EFile const& file) const noexcept -> bool;
        };

        static auto read(std::span<char const> data) -> EMAN;
        static auto read_file(fs::path const& path) -> EMAN;

        auto filter(Filter const& filter) -> void;

        auto chunk(ChunkGUID const& guid) const -> EChunk const&;

    private:
        struct Raw;
    };
}
