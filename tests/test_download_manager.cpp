#include "cdn/download_manager.hpp"
#include "testing.hpp"

#include <atomic>
#include <cstdio>
#include <gtest/gtest.h>
#include <new>
#include <thread>
#include <vector>

namespace {

using namespace ngdp::cdn;
using testutil::FakeTransport;

const std::string kHex = "abcdef0123456789abcdef0123456789";
const std::string kDataPath = "/tpr/test/data/ab/cd/" + kHex;

class DownloadManagerTests : public ::testing::Test {
  protected:
    DownloadOptions Options() {
        DownloadOptions opt;
        opt.hosts = {"cdn-a.example", "http://cdn-b.example/"};
        opt.cdn_path = "tpr/test";
        opt.max_attempts = 4;
        return opt;
    }

    std::unique_ptr<DownloadManager> Make(DownloadOptions opt) {
        auto dm = std::make_unique<DownloadManager>(transport, std::move(opt), cancel);
        dm->SetSleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
        return dm;
    }

    FakeTransport transport;
    std::atomic_bool cancel{false};
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST(ObjectPathTests, LayoutPerKind) {
    EXPECT_EQ(ObjectPath("tpr/wow", ObjectRef::DataHex(kHex)), "/tpr/wow/data/ab/cd/" + kHex);
    EXPECT_EQ(ObjectPath("tpr/wow", ObjectRef::Config(kHex)), "/tpr/wow/config/ab/cd/" + kHex);
    EXPECT_EQ(ObjectPath("tpr/wow", ObjectRef::Index(kHex)), "/tpr/wow/data/ab/cd/" + kHex + ".index");
    EXPECT_EQ(ObjectPath("tpr/wow", ObjectRef::Path("/versions")), "/tpr/wow/versions");
    EXPECT_EQ(ObjectPath("", ObjectRef::Path("versions")), "/versions");
    EXPECT_EQ(ObjectPath("", ObjectRef::DataHex(kHex)), "/data/ab/cd/" + kHex);
}

TEST_F(DownloadManagerTests, FetchesFromFirstHost) {
    transport.Add(kDataPath, FakeTransport::Ok(testutil::Bytes("payload")));
    auto dm = Make(Options());

    std::vector<std::uint8_t> out;
    auto r = dm->Fetch(ObjectRef::DataHex(kHex), out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out, testutil::Bytes("payload"));

    auto reqs = transport.Requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].url, "http://cdn-a.example" + kDataPath);
    EXPECT_FALSE(reqs[0].range.has_value());
    EXPECT_EQ(dm->BytesFetched(), 7u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(DownloadManagerTests, RetriesTransientErrorsAcrossHosts) {
    transport.Add(kDataPath, FakeTransport::Status(503));
    transport.Add(kDataPath, FakeTransport::Timeout());
    transport.Add(kDataPath, FakeTransport::Ok(testutil::Bytes("ok")));
    auto dm = Make(Options());

    std::vector<std::uint8_t> out;
    auto r = dm->Fetch(ObjectRef::DataHex(kHex), out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out, testutil::Bytes("ok"));

    auto reqs = transport.Requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].url, "http://cdn-a.example" + kDataPath);
    EXPECT_EQ(reqs[1].url, "http://cdn-b.example" + kDataPath);
    EXPECT_EQ(reqs[2].url, "http://cdn-a.example" + kDataPath);

    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(250));
    EXPECT_EQ(sleeps[1], std::chrono::milliseconds(500));
}

TEST_F(DownloadManagerTests, GivesUpAfterMaxAttempts) {
    transport.Add(kDataPath, FakeTransport::Status(500));
    auto opt = Options();
    opt.max_attempts = 6;
    opt.initial_backoff = std::chrono::milliseconds(1000);
    opt.max_backoff = std::chrono::milliseconds(3000);
    auto dm = Make(opt);

    std::vector<std::uint8_t> out;
    auto r = dm->Fetch(ObjectRef::DataHex(kHex), out);
    EXPECT_EQ(r.code, ngdp::ErrorCode::ServerError);
    EXPECT_EQ(r.kind(), ngdp::ErrorKind::Transient);
    EXPECT_EQ(transport.RequestCount(kDataPath), 6u);

    const std::vector<std::chrono::milliseconds> expected = {
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000), std::chrono::milliseconds(3000),
        std::chrono::milliseconds(3000), std::chrono::milliseconds(3000)};
    EXPECT_EQ(sleeps, expected);
}

TEST_F(DownloadManagerTests, PermanentErrorsAreNotRetried) {
    auto dm = Make(Options());
    std::vector<std::uint8_t> out;

    auto r = dm->Fetch(ObjectRef::DataHex(kHex), out);
    EXPECT_EQ(r.code, ngdp::ErrorCode::NotFound);
    EXPECT_EQ(transport.RequestCount(kDataPath), 1u);

    const std::string config_path = "/tpr/test/config/ab/cd/" + kHex;
    transport.Add(config_path, FakeTransport::Status(403));
    r = dm->Fetch(ObjectRef::Config(kHex), out);
    EXPECT_EQ(r.code, ngdp::ErrorCode::HttpError);
    EXPECT_EQ(transport.RequestCount(config_path), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(DownloadManagerTests, RangeRequests) {
    transport.Add(kDataPath, FakeTransport::Ok(testutil::Bytes("0123456789")));
    auto dm = Make(Options());
    std::vector<std::uint8_t> out;

    // The fake ignores the range and answers with the whole object.
    auto r = dm->Fetch(ObjectRef::DataHex(kHex, ByteRange{2, 5}), out);
    EXPECT_EQ(r.code, ngdp::ErrorCode::ChecksumMismatch);
    EXPECT_EQ(transport.RequestCount(kDataPath), 1u);
    auto reqs = transport.Requests();
    ASSERT_TRUE(reqs.back().range.has_value());
    EXPECT_EQ(reqs.back().range->first, 2u);
    EXPECT_EQ(reqs.back().range->last, 5u);

    r = dm->Fetch(ObjectRef::DataHex(kHex, ByteRange{0, 9}), out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out.size(), 10u);

    EXPECT_EQ(dm->Fetch(ObjectRef::DataHex(kHex, ByteRange{5, 2}), out).code, ngdp::ErrorCode::InvalidArgument);
}

TEST_F(DownloadManagerTests, RejectsUnusableInput) {
    auto opt = Options();
    opt.hosts.clear();
    auto dm = Make(opt);
    std::vector<std::uint8_t> out;
    EXPECT_EQ(dm->Fetch(ObjectRef::DataHex(kHex), out).code, ngdp::ErrorCode::InvalidArgument);

    auto dm2 = Make(Options());
    EXPECT_EQ(dm2->Fetch(ObjectRef::DataHex(""), out).code, ngdp::ErrorCode::InvalidArgument);
    EXPECT_TRUE(transport.Requests().empty());
}

TEST_F(DownloadManagerTests, CancelStopsBeforeNextAttempt) {
    transport.Add(kDataPath, FakeTransport::Status(502));
    auto dm = std::make_unique<DownloadManager>(transport, Options(), cancel);
    dm->SetSleeper([this](std::chrono::milliseconds) { cancel = true; });

    std::vector<std::uint8_t> out;
    auto r = dm->Fetch(ObjectRef::DataHex(kHex), out);
    EXPECT_EQ(r.code, ngdp::ErrorCode::Cancelled);
    EXPECT_EQ(transport.RequestCount(kDataPath), 1u);
}

TEST_F(DownloadManagerTests, LimitsRequestsInFlight) {
    std::vector<std::string> hexes;
    for (int i = 0; i < 24; ++i) {
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%02x%02x%028d", i, i, i);
        hexes.push_back(buf);
        transport.Add(ObjectPath("tpr/test", ObjectRef::DataHex(buf)), FakeTransport::Ok(testutil::Bytes("x")));
    }
    transport.SetDelayMicros(2000);

    auto opt = Options();
    opt.max_in_flight = 3;
    auto dm = Make(opt);

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (size_t i = static_cast<size_t>(t); i < hexes.size(); i += 8) {
                std::vector<std::uint8_t> out;
                if (dm->Fetch(ObjectRef::DataHex(hexes[i]), out).ok)
                    ++ok;
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(ok.load(), 24);
    EXPECT_LE(transport.MaxInFlight(), 3);
    EXPECT_EQ(dm->Requests(), 24u);
}

// Throws from the first Get, then defers to the wrapped transport.
class ThrowingTransport final : public ngdp::cdn::IHttpTransport {
  public:
    explicit ThrowingTransport(FakeTransport& next) : next_(next) {}

    ngdp::Result Get(const ngdp::cdn::HttpRequest& req, ngdp::cdn::HttpResponse& out) override {
        if (!thrown_) {
            thrown_ = true;
            throw std::bad_alloc();
        }
        return next_.Get(req, out);
    }

  private:
    FakeTransport& next_;
    bool thrown_ = false;
};

TEST_F(DownloadManagerTests, ThrowingTransportReleasesSlot) {
    transport.Add(kDataPath, FakeTransport::Ok(testutil::Bytes("payload")));
    ThrowingTransport throwing(transport);
    auto opt = Options();
    opt.max_in_flight = 1;
    DownloadManager dm(throwing, opt, cancel);
    dm.SetSleeper([](std::chrono::milliseconds) {});

    std::vector<std::uint8_t> out;
    EXPECT_THROW(dm.Fetch(ObjectRef::DataHex(kHex), out), std::bad_alloc);
    EXPECT_EQ(dm.InFlight(), 0);

    auto r = dm.Fetch(ObjectRef::DataHex(kHex), out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out, testutil::Bytes("payload"));
    EXPECT_EQ(dm.InFlight(), 0);
}

} // namespace
