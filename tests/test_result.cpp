#include <gtest/gtest.h>

#include "util/result.hpp"

#include <cerrno>

namespace {

using ngdp::ErrorCode;
using ngdp::ErrorKind;
using ngdp::Result;

TEST(ResultTests, OkByDefault) {
    Result r = Result::Ok();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::None);
    EXPECT_EQ(r.kind(), ErrorKind::None);
}

TEST(ResultTests, ErrnoMapsToCode) {
    EXPECT_EQ(Result::Fail(ENOSPC, "full").code, ErrorCode::ResourceExhausted);
    EXPECT_EQ(Result::Fail(EMFILE, "fds").code, ErrorCode::ResourceExhausted);
    EXPECT_EQ(Result::Fail(ENOENT, "gone").code, ErrorCode::NotFound);
    EXPECT_EQ(Result::Fail(EIO, "io").code, ErrorCode::Io);

    auto r = Result::Fail(ENOSPC, "full");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOSPC);
    EXPECT_EQ(r.msg, "full");
}

TEST(ResultTests, KindClassification) {
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::Timeout), ErrorKind::Transient);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::ServerError), ErrorKind::Transient);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::ChecksumMismatch), ErrorKind::DataIntegrity);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::KeyMismatch), ErrorKind::DataIntegrity);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::MissingDecryptionKey), ErrorKind::MissingKey);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::ChunkSizeMismatch), ErrorKind::Corrupt);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::IndexCorrupt), ErrorKind::Corrupt);
    EXPECT_EQ(ngdp::ErrorKindOf(ErrorCode::HttpError), ErrorKind::Usage);
    EXPECT_STREQ(ngdp::ToString(ErrorCode::CorruptArchive), "CorruptArchive");
    EXPECT_STREQ(ngdp::ToString(ErrorKind::Transient), "Transient");
}

} // namespace
