#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <unordered_map>

#include "buffer.hpp"
#include "common.hpp"
#include "echunk.hpp"
#include "emanifest.hpp"

namespace elib {
    // Keeps decompressed chunks in memory for as long as some not yet written
    // chunk part still refers to them.
    struct ECache {
        using Payload = std::shared_ptr<Buffer const>;

        ECache() = default;
        ECache(ECache const&) = delete;

        auto seed(std::span<EFile const> files) -> void;

        auto remaining(ChunkGUID const& guid) const noexcept -> std::int64_t;

        auto get(ChunkGUID const& guid) const noexcept -> Payload;

        // Retains payload only when it has more readers after the current one.
        auto put(ChunkGUID const& guid, Payload payload) -> bool;

        auto consume(ChunkGUID const& guid) noexcept -> void;

        auto entries() const noexcept -> std::size_t { return cache_.size(); }

        auto memory() const noexcept -> std::size_t { return memory_; }

    private:
        std::unordered_map<ChunkGUID, std::int64_t> uses_ = {};
        std::unordered_map<ChunkGUID, Payload> cache_ = {};
        std::size_t memory_ = {};
    };
}
