#include <gtest/gtest.h>

#include "checksum.hpp"
#include "test_util.hpp"

using qrdrop::recv::Checksum;
using qrdrop::recv::test::to_bytes;

TEST(Checksum, Md5KnownVector) {
    EXPECT_EQ(Checksum::md5_hex(to_bytes("abc")),
              "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(Checksum::md5_hex({}), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(Checksum, Blake2b512KnownVector) {
    auto digest = Checksum::blake2b(to_bytes("abc"), 64);
    EXPECT_EQ(Checksum::to_hex(digest),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST(Checksum, Blake2bShortOutputIsNotTruncation) {
    auto data  = to_bytes("segment payload");
    auto full  = Checksum::blake2b(data, 64);
    auto short4 = Checksum::blake2b(data, 4);

    ASSERT_EQ(short4.size(), 4u);
    ASSERT_EQ(full.size(), 64u);
    // The output length is part of the BLAKE2b parameter block.
    EXPECT_NE(short4, std::vector<uint8_t>(full.begin(), full.begin() + 4));
    EXPECT_EQ(short4, Checksum::blake2b(data, 4));
}

TEST(Checksum, Blake2bRejectsOutOfRangeLength) {
    auto data = to_bytes("x");
    EXPECT_TRUE(Checksum::blake2b(data, 0).empty());
    EXPECT_TRUE(Checksum::blake2b(data, 65).empty());
}

TEST(Checksum, ShortDigestSupportMatchesBlake2b) {
    auto data = std::vector<uint8_t>{'q', 'r'};
    bool works = !Checksum::blake2b(data, 16).empty();
    EXPECT_EQ(Checksum::short_digests_supported(), works);
    // Repeated failures stay quiet and keep returning empty.
    EXPECT_EQ(Checksum::blake2b(data, 16).empty(), !works);
    EXPECT_EQ(Checksum::blake2b(data, Checksum::kBlake2bMaxLen).size(),
              Checksum::kBlake2bMaxLen);
}

TEST(Checksum, HexIsLowercase) {
    std::vector<uint8_t> v{0x00, 0xAB, 0x7F, 0xFF};
    EXPECT_EQ(Checksum::to_hex(v), "00ab7fff");
}

TEST(Checksum, Base64Decode) {
    auto decoded = Checksum::base64_decode("QUJDRA==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, to_bytes("ABCD"));

    auto empty = Checksum::base64_decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Checksum, Base64RejectsGarbage) {
    EXPECT_FALSE(Checksum::base64_decode("QU*DRA==").has_value());
}
