#include <gtest/gtest.h>

#include "helpers.hpp"

using namespace elib;
using namespace elib::test;

TEST(Common, SplitsCommaLists) {
    EXPECT_EQ(str_list("a.txt, dir/b.bin,,c"), (std::vector<std::string>{"a.txt", "dir/b.bin", "c"}));
    EXPECT_TRUE(str_list("").empty());
    EXPECT_EQ(str_list("http://a/,http://b"), (std::vector<std::string>{"http://a/", "http://b"}));
}

TEST(Common, HexConversion) {
    auto bytes = std::array<std::uint8_t, 3>{};
    EXPECT_TRUE(from_hex("00ffA0", bytes));
    EXPECT_EQ(bytes, (std::array<std::uint8_t, 3>{0x00, 0xff, 0xa0}));
    EXPECT_EQ(to_hex(bytes), "00ffa0");
    EXPECT_FALSE(from_hex("00ff", bytes));
    EXPECT_FALSE(from_hex("00fg00", bytes));
}

TEST(Common, CleanPath) {
    EXPECT_EQ(clean_path("dir\\sub\\file.txt"), "dir/sub/file.txt");
    EXPECT_EQ(clean_path("http://cdn/base//"), "http://cdn/base");
}

TEST(Hash, Sha1OfKnownInput) {
    EXPECT_EQ(to_hex(sha1(std::string_view("abc"))), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Hash, Sha1OfFileMatchesMemory) {
    auto dir = TempDir{};
    auto const content = std::string(3 * 1024 * 1024 + 17, 'e');
    write_text(dir.path / "big.bin", content);
    EXPECT_EQ(sha1_file(dir.path / "big.bin"), sha1(content));
    EXPECT_FALSE(sha1_file(dir.path / "missing.bin"));
    EXPECT_FALSE(sha1_file(dir.path));
}
