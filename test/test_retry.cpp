#include <gtest/gtest.h>

#include "helpers.hpp"

using namespace elib;
using namespace elib::test;

namespace {
    // Fails first attempts with given error kind.
    struct FlakySource final : ChunkSource {
        ErrorKind kind;
        std::uint32_t failures;
        std::uint32_t calls = {};

        FlakySource(ErrorKind kind, std::uint32_t failures) : kind(kind), failures(failures) {}

        auto fetch(EChunk const&) -> Buffer override {
            if (calls++ < failures) {
                throw_error(kind, __func__, ": flaky");
            }
            return to_buffer(std::string_view("payload"));
        }
    };

    auto const chunk = EChunk{
        .guid = guid(1),
        .hash = 0,
        .sha1 = {},
        .data_group = 0,
        .file_size = 0,
    };
}

TEST(Retry, RetriesTransientErrors) {
    for (auto kind : {ErrorKind::Transport, ErrorKind::ChunkCorrupt}) {
        auto inner = FlakySource(kind, 2);
        auto retry = Retry(inner, 2);
        EXPECT_EQ(to_string(retry.fetch(chunk)), "payload");
        EXPECT_EQ(inner.calls, 3u);
    }
}

TEST(Retry, GivesUpAfterLastAttempt) {
    auto inner = FlakySource(ErrorKind::Transport, 10);
    auto retry = Retry(inner, 3);
    try {
        retry.fetch(chunk);
        FAIL() << "expected Transport";
    } catch (Error const& error) {
        EXPECT_EQ(error.kind(), ErrorKind::Transport);
    }
    EXPECT_EQ(inner.calls, 4u);
    error_stack().clear();
}

TEST(Retry, OtherErrorsPropagateImmediately) {
    for (auto kind : {ErrorKind::UnknownChunkEncoding, ErrorKind::ChunkHeaderTruncated, ErrorKind::ManifestCorrupt}) {
        auto inner = FlakySource(kind, 1);
        auto retry = Retry(inner, 5);
        EXPECT_THROW(retry.fetch(chunk), Error);
        EXPECT_EQ(inner.calls, 1u);
    }
    error_stack().clear();
}

TEST(Retry, MissingBlobIsRetriedThenReported) {
    auto source = MemorySource{};
    auto retry = Retry(source, 2);
    EXPECT_THROW(retry.fetch(chunk), Error);
    EXPECT_EQ(source.fetches[guid(1)], 3u);
    error_stack().clear();
}
