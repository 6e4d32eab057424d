#include "io/span_reader.hpp"
#include "io/zlib_stream.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace {

using testutil::MemoryReader;

std::vector<std::uint8_t> Deflate(const std::vector<std::uint8_t>& in, int bits = 15) {
    std::vector<std::uint8_t> out;
    auto r = ngdp::ZlibCompress(in, 6, bits, out);
    EXPECT_TRUE(r.ok) << r.msg;
    return out;
}

TEST(ZlibStreamTests, InflatesWhatWasDeflated) {
    const auto plain = testutil::Pattern(200000, 7);
    auto packed = Deflate(plain);

    ngdp::ZlibReader z(std::make_unique<MemoryReader>(packed, 100, true));
    const std::string out = testutil::ReadAll(z);
    EXPECT_EQ(out, std::string(plain.begin(), plain.end()));
    EXPECT_TRUE(z.Finished());
}

TEST(ZlibStreamTests, SmallWindowIsReadable) {
    const auto plain = testutil::Bytes("tiny payload tiny payload tiny payload");
    auto packed = Deflate(plain, 9);

    ngdp::ZlibReader z(std::make_unique<ngdp::SpanReader>(packed));
    EXPECT_EQ(testutil::ReadAll(z), "tiny payload tiny payload tiny payload");
}

TEST(ZlibStreamTests, TruncatedStreamIsNotFinished) {
    const auto plain = testutil::Pattern(50000, 3);
    auto packed = Deflate(plain);
    packed.resize(packed.size() / 2);

    ngdp::ZlibReader z(std::make_unique<MemoryReader>(packed));
    std::vector<std::uint8_t> buf(4096);
    while (z.Read(buf) > 0) {
    }
    EXPECT_FALSE(z.Finished());
}

TEST(ZlibStreamTests, GarbageInputFails) {
    ngdp::ZlibReader z(std::make_unique<MemoryReader>(std::string("this is not zlib at all")));
    std::vector<std::uint8_t> buf(64);
    EXPECT_LT(z.Read(buf), 0);
}

TEST(ZlibStreamTests, CompressRejectsBadParameters) {
    std::vector<std::uint8_t> out;
    EXPECT_EQ(ngdp::ZlibCompress(testutil::Bytes("x"), 6, 8, out).code, ngdp::ErrorCode::InvalidArgument);
    EXPECT_EQ(ngdp::ZlibCompress(testutil::Bytes("x"), 10, 15, out).code, ngdp::ErrorCode::InvalidArgument);
    EXPECT_TRUE(out.empty());
}

} // namespace
