#include <gtest/gtest.h>

#include <elib/ecache.hpp>

#include "helpers.hpp"

using namespace elib;
using namespace elib::test;

namespace {
    auto payload(std::string_view text) -> ECache::Payload { return std::make_shared<Buffer const>(to_buffer(text)); }

    auto shared_chunk_manifest() -> EMAN {
        auto builder = ManifestBuilder{};
        builder.chunk(guid(1), "HelloWorld")
            .file("a.txt", "HelloWorld", {{guid(1), 0, 5}, {guid(1), 5, 5}})
            .file("b.txt", "Hello", {{guid(1), 0, 5}});
        return builder.manifest;
    }
}

TEST(Cache, SeedCountsEveryPart) {
    auto const eman = shared_chunk_manifest();
    auto cache = ECache{};
    cache.seed(eman.files);
    EXPECT_EQ(cache.remaining(guid(1)), 3);
    EXPECT_EQ(cache.remaining(guid(2)), 0);
}

TEST(Cache, ConsumeReleasesPayloadAfterLastReader) {
    auto const eman = shared_chunk_manifest();
    auto cache = ECache{};
    cache.seed(eman.files);

    EXPECT_TRUE(cache.put(guid(1), payload("HelloWorld")));
    EXPECT_EQ(cache.entries(), 1u);
    EXPECT_EQ(cache.memory(), 10u);

    cache.consume(guid(1));
    cache.consume(guid(1));
    EXPECT_EQ(cache.remaining(guid(1)), 1);
    ASSERT_TRUE(cache.get(guid(1)));

    auto held = cache.get(guid(1));
    cache.consume(guid(1));
    EXPECT_EQ(cache.remaining(guid(1)), 0);
    EXPECT_FALSE(cache.get(guid(1)));
    EXPECT_EQ(cache.entries(), 0u);
    EXPECT_EQ(cache.memory(), 0u);
    EXPECT_EQ(to_string(*held), "HelloWorld");
}

TEST(Cache, PutSkipsChunksWithoutFurtherReaders) {
    auto builder = ManifestBuilder{};
    builder.chunk(guid(1), "abc").file("a.txt", "abc", {{guid(1), 0, 3}});
    auto cache = ECache{};
    cache.seed(builder.manifest.files);
    EXPECT_FALSE(cache.put(guid(1), payload("abc")));
    EXPECT_FALSE(cache.put(guid(9), payload("abc")));
    EXPECT_EQ(cache.entries(), 0u);
}

TEST(Cache, ConsumeOfUnknownChunkIsIgnored) {
    auto cache = ECache{};
    cache.consume(guid(5));
    EXPECT_EQ(cache.remaining(guid(5)), 0);
}
