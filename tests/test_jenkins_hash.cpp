#include "crypto/jenkins_hash.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace {

TEST(JenkinsHashTests, EmptyInput) {
    const auto empty = testutil::Bytes("");
    EXPECT_EQ(ngdp::HashLittle2(empty, 0, 0), std::make_pair(0xdeadbeefu, 0xdeadbeefu));
    EXPECT_EQ(ngdp::HashLittle2(empty, 0, 0xdeadbeef), std::make_pair(0xbd5b7ddeu, 0xdeadbeefu));
}

TEST(JenkinsHashTests, ReferenceVectors) {
    const auto text = testutil::Bytes("Four score and seven years ago");
    EXPECT_EQ(ngdp::HashLittle2(text, 0, 0), std::make_pair(0x17770551u, 0xce7226e6u));
    EXPECT_EQ(ngdp::HashLittle2(text, 0, 1), std::make_pair(0xe3607caeu, 0xbd371de4u));
    EXPECT_EQ(ngdp::HashLittle2(text, 1, 0), std::make_pair(0xcd628161u, 0x6cbea4b3u));
    EXPECT_EQ(ngdp::HashLittle(text, 0), 0x17770551u);
    EXPECT_EQ(ngdp::HashLittle(text, 1), 0xcd628161u);
}

TEST(JenkinsHashTests, EveryTailLengthIsStable) {
    const auto data = testutil::Pattern(40, 9);
    for (size_t n = 0; n <= data.size(); ++n) {
        std::span<const std::uint8_t> s(data.data(), n);
        EXPECT_EQ(ngdp::HashLittle2(s, 0, 0).first, ngdp::HashLittle(s, 0)) << n;
    }
}

} // namespace
