#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "buffer.hpp"
#include "common.hpp"
#include "echunk.hpp"

namespace elib {
    // Anything that can produce the decompressed, verified payload of a chunk.
    struct ChunkSource {
        virtual ~ChunkSource() noexcept = default;

        virtual auto fetch(EChunk const& chunk) -> Buffer = 0;
    };

    struct ECDN final : ChunkSource {
        static constexpr char const* DEFAULT_URL = "http://epicgames-download1.akamaized.net/Builds/Fortnite/CloudDir";

        struct Options {
            std::vector<std::string> urls = {};
            bool verbose = {};
            long buffer = {};
            long connect_timeout = {};
            std::string proxy = {};
            std::string useragent = {};
            std::size_t low_speed_limit = 64 * KiB;
            std::size_t low_speed_time = 0;
        };

        ECDN(Options const& options);
        ECDN(ECDN const&) = delete;
        ~ECDN() noexcept;

        // Downloads whole resource, non 2xx status is an error.
        auto get(std::string const& url) -> Buffer;

        auto fetch(EChunk const& chunk) -> Buffer override;

        // Next base url, round robin.
        auto next_url() noexcept -> std::string const&;

    private:
        Options options_;
        void* handle_;
        std::size_t next_ = {};
    };

    // Retries transient failures of inner source.
    struct Retry final : ChunkSource {
        Retry(ChunkSource& inner, std::uint32_t retries, std::chrono::milliseconds backoff = {}) noexcept
            : inner_(inner), retries_(retries), backoff_(backoff) {}

        auto fetch(EChunk const& chunk) -> Buffer override;

        static auto is_transient(ErrorKind kind) noexcept -> bool;

    private:
        ChunkSource& inner_;
        std::uint32_t retries_;
        std::chrono::milliseconds backoff_;
    };
}
