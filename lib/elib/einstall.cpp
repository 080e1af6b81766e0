#include "einstall.hpp"

#include <iostream>

using namespace elib;

namespace {
    // Removes destination unless finished.
    struct PartialFile {
        PartialFile(fs::path const& path) : path_(path), file_(path, IO::WRITE | IO::TRUNCATE) {}
        PartialFile(PartialFile const&) = delete;
        ~PartialFile() noexcept {
            file_ = IO::File{};
            if (!finished_) {
                auto ec = std::error_code{};
                fs::remove(path_, ec);
            }
        }

        auto file() noexcept -> IO::File& { return file_; }

        auto finish() noexcept -> void { finished_ = true; }

    private:
        fs::path path_;
        IO::File file_;
        bool finished_ = {};
    };

    auto is_fatal(ErrorKind kind) noexcept -> bool {
        return kind == ErrorKind::ManifestCorrupt || kind == ErrorKind::Cancelled;
    }
}

auto EInstall::run(EMAN const& manifest, ChunkSource& source) -> Summary {
    auto cache = ECache{};
    return run(manifest, source, cache);
}

auto EInstall::run(EMAN const& manifest, ChunkSource& source, ECache& cache) -> Summary {
    auto summary = Summary{};
    cache.seed(manifest.files);
    states_.clear();
    for (auto const& file : manifest.files) {
        states_[file.name] = State::NotStarted;
    }

    for (std::size_t index = manifest.files.size(); auto const& file : manifest.files) {
        check_cancel();
        auto const state = install_file(manifest, file, cache, source, summary, index--);
        states_[file.name] = state;
        switch (state) {
            case State::OnDiskValid:
                ++summary.found;
                break;
            case State::Done:
                ++summary.downloaded;
                break;
            default:
                ++summary.failed;
                summary.failed_files.push_back(file.name);
                break;
        }
    }

    if (!options_.no_verify) {
        for (auto const& file : manifest.files) {
            check_cancel();
            if (states_[file.name] == State::Failed) {
                continue;
            }
            if (auto mismatch = verify(file)) {
                std::cerr << fmt::format("{}: {} got {} want {}",
                                         error_kind_name(ErrorKind::HashMismatch),
                                         mismatch->file,
                                         mismatch->actual ? to_hex(*mismatch->actual) : "missing",
                                         to_hex(mismatch->expected))
                          << std::endl;
                summary.mismatches.push_back(std::move(*mismatch));
            }
        }
    }
    return summary;
}

auto EInstall::path(EFile const& file) const -> fs::path {
    auto const relative = fs::path(clean_path(file.name)).lexically_normal();
    if (relative.empty() || relative.is_absolute() || relative.has_root_path() || *relative.begin() == "..")
        [[unlikely]] {
        elib_raise(ErrorKind::Generic, fmt::format(": file name escapes output: {}", file.name).c_str());
    }
    return options_.output / relative;
}

auto EInstall::verify(EFile const& file) const -> std::optional<Mismatch> {
    auto actual = sha1_file(path(file));
    if (actual && *actual == file.hash) {
        return std::nullopt;
    }
    return Mismatch{
        .file = file.name,
        .expected = file.hash,
        .actual = actual,
    };
}

auto EInstall::state(std::string const& name) const noexcept -> State {
    if (auto i = states_.find(name); i != states_.end()) {
        return i->second;
    }
    return State::NotStarted;
}

auto EInstall::check_cancel() const -> void {
    if (options_.cancel && options_.cancel->load()) [[unlikely]] {
        elib_raise(ErrorKind::Cancelled, ": cancelled");
    }
}

auto EInstall::install_file(EMAN const& manifest,
                            EFile const& file,
                            ECache& cache,
                            ChunkSource& source,
                            Summary& summary,
                            std::size_t index) -> State {
    std::cout << "START: " << file.name << std::endl;
    auto const depth = error_stack().size();
    auto next = std::size_t{};
    auto finished = false;
    try {
        elib_trace("file: %s", file.name.c_str());
        auto const path = this->path(file);

        if (auto ec = std::error_code{}; fs::is_regular_file(path, ec)) {
            if (auto hash = sha1_file(path); hash && *hash == file.hash) {
                for (; next != file.parts.size(); ++next) {
                    cache.consume(file.parts[next].guid);
                }
                std::cout << "FOUND!" << std::endl;
                return State::OnDiskValid;
            }
        }

        states_[file.name] = State::Downloading;
        auto partial = PartialFile(path);
        auto done = std::uint64_t{};
        progress_bar p("DOWNLOAD", options_.no_progress, (std::uint32_t)index, done, file.size());
        for (; next != file.parts.size(); ++next) {
            check_cancel();
            auto const& part = file.parts[next];
            elib_trace("part: %zu chunk: %s", next, part.guid.str().c_str());
            auto payload = cache.get(part.guid);
            if (!payload) {
                payload = std::make_shared<Buffer const>(source.fetch(manifest.chunk(part.guid)));
                ++summary.fetched;
                cache.put(part.guid, payload);
            }
            if (!in_range(part.offset, part.size, payload->size())) [[unlikely]] {
                elib_raise(ErrorKind::ChunkCorrupt,
                           fmt::format(": part {}+{} outside of chunk of size {}",
                                       part.offset,
                                       part.size,
                                       payload->size())
                               .c_str());
            }
            elib_assert(partial.file().append(payload->subspan(part.offset, part.size)));
            cache.consume(part.guid);
            done += part.size;
            p.update(done);
        }
        if (file.executable) {
            auto const exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
            fs::permissions(path, exec, fs::perm_options::add);
        }
        partial.finish();
        finished = true;
    } catch (Error const& error) {
        if (is_fatal(error.kind())) {
            throw;
        }
        std::cerr << fmt::format("FAIL: {}: {}: {}", file.name, error_kind_name(error.kind()), error.what())
                  << std::endl;
    } catch (std::exception const& error) {
        std::cerr << fmt::format("FAIL: {}: {}", file.name, error.what()) << std::endl;
    }

    if (finished) {
        std::cout << "OK!" << std::endl;
        return State::Done;
    }
    for (auto i = depth; i < error_stack().size(); ++i) {
        std::cerr << error_stack()[i] << std::endl;
    }
    error_stack().resize(depth);
    for (; next != file.parts.size(); ++next) {
        cache.consume(file.parts[next].guid);
    }
    std::cout << "FAIL!" << std::endl;
    return State::Failed;
}
