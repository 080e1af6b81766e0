#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"
#include "ecache.hpp"
#include "ecdn.hpp"
#include "ehash.hpp"
#include "emanifest.hpp"

namespace elib {
    // Reconstructs the files of a manifest under an output directory.
    struct EInstall {
        struct Options {
            fs::path output = "files";
            bool no_verify = {};
            bool no_progress = {};
            std::atomic_bool const* cancel = {};
        };

        enum class State {
            NotStarted,
            OnDiskValid,
            Downloading,
            Done,
            Failed,
        };

        struct Mismatch {
            std::string file;
            SHA1 expected;
            std::optional<SHA1> actual;
        };

        struct Summary {
            std::size_t found = {};
            std::size_t downloaded = {};
            std::size_t failed = {};
            std::size_t fetched = {};
            std::vector<std::string> failed_files = {};
            std::vector<Mismatch> mismatches = {};

            auto ok() const noexcept -> bool { return failed_files.empty() && mismatches.empty(); }
        };

        EInstall(Options const& options) : options_(options) {}
        EInstall(EInstall const&) = delete;

        // Only ManifestCorrupt and Cancelled errors escape, everything else fails single file.
        auto run(EMAN const& manifest, ChunkSource& source) -> Summary;

        // Same as above, seeds given cache and leaves it for inspection.
        auto run(EMAN const& manifest, ChunkSource& source, ECache& cache) -> Summary;

        // Destination of file under output directory, rejects names escaping it.
        auto path(EFile const& file) const -> fs::path;

        auto verify(EFile const& file) const -> std::optional<Mismatch>;

        auto state(std::string const& name) const noexcept -> State;

    private:
        auto install_file(EMAN const& manifest,
                          EFile const& file,
                          ECache& cache,
                          ChunkSource& source,
                          Summary& summary,
                          std::size_t index) -> State;

        auto check_cancel() const -> void;

        Options options_;
        std::unordered_map<std::string, State> states_ = {};
    };
}
