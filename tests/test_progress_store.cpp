#include "crypto/md5.hpp"
#include "install/progress_store.hpp"
#include "testing.hpp"

#include <csignal>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <sys/resource.h>
#include <vector>

namespace {

ngdp::EKey KeyFor(int i) {
    return ngdp::EKey(ngdp::Md5(testutil::Bytes("progress-" + std::to_string(i))));
}

class ProgressStoreTests : public ::testing::Test {
  protected:
    std::unique_ptr<ngdp::ProgressStore> Open(const std::string& version) {
        std::unique_ptr<ngdp::ProgressStore> store;
        auto r = ngdp::ProgressStore::Open(Path(), version, store);
        EXPECT_TRUE(r.ok) << r.msg;
        return store;
    }

    std::string Path() const { return tmp.Path() + "/" + ngdp::kProgressFileName; }

    testutil::TemporaryDirectory tmp;
};

TEST_F(ProgressStoreTests, FreshStoreWritesHeader) {
    auto store = Open("v1");
    ASSERT_TRUE(store);
    EXPECT_EQ(store->CompletedCount(), 0u);
    EXPECT_EQ(testutil::ReadFile(Path()), "{\"manifest_version\":\"v1\"}\n");
}

TEST_F(ProgressStoreTests, RecordsSurviveReopen) {
    {
        auto store = Open("v1");
        ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
        ASSERT_TRUE(store->RecordCompleted(KeyFor(2)).ok);
        ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
        EXPECT_EQ(store->CompletedCount(), 2u);
    }
    const std::string content = testutil::ReadFile(Path());
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 3);
    EXPECT_NE(content.find("{\"ekey\":\"" + KeyFor(2).Hex() + "\"}\n"), std::string::npos);

    auto store = Open("v1");
    EXPECT_EQ(store->CompletedCount(), 2u);
    EXPECT_TRUE(store->IsCompleted(KeyFor(1)));
    EXPECT_TRUE(store->IsCompleted(KeyFor(2)));
    EXPECT_FALSE(store->IsCompleted(KeyFor(3)));
}

// Caps the size of files this process may write; restores the old cap on exit.
class FileSizeCap {
  public:
    explicit FileSizeCap(rlim_t bytes) {
        old_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        ::getrlimit(RLIMIT_FSIZE, &saved_);
        rlimit capped = saved_;
        capped.rlim_cur = bytes;
        ::setrlimit(RLIMIT_FSIZE, &capped);
    }
    ~FileSizeCap() {
        ::setrlimit(RLIMIT_FSIZE, &saved_);
        std::signal(SIGXFSZ, old_handler_);
    }

  private:
    rlimit saved_{};
    void (*old_handler_)(int) = nullptr;
};

TEST_F(ProgressStoreTests, FailedAppendLeavesNoPartialLine) {
    {
        auto store = Open("v1");
        ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
        const std::uint64_t before = testutil::FileSize(Path());
        {
            // Room for part of the next line only.
            FileSizeCap cap(before + 20);
            EXPECT_FALSE(store->RecordCompleted(KeyFor(2)).ok);
        }
        EXPECT_EQ(testutil::FileSize(Path()), before);
        EXPECT_FALSE(store->IsCompleted(KeyFor(2)));
        ASSERT_TRUE(store->RecordCompleted(KeyFor(3)).ok);
    }

    auto store = Open("v1");
    EXPECT_EQ(store->CompletedCount(), 2u);
    EXPECT_TRUE(store->IsCompleted(KeyFor(1)));
    EXPECT_FALSE(store->IsCompleted(KeyFor(2)));
    EXPECT_TRUE(store->IsCompleted(KeyFor(3)));
}

TEST_F(ProgressStoreTests, OtherManifestVersionStartsOver) {
    {
        auto store = Open("v1");
        ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
    }
    auto store = Open("v2");
    EXPECT_EQ(store->CompletedCount(), 0u);
    EXPECT_FALSE(store->IsCompleted(KeyFor(1)));
    EXPECT_EQ(testutil::ReadFile(Path()), "{\"manifest_version\":\"v2\"}\n");
}

TEST_F(ProgressStoreTests, TornLastLineIsDropped) {
    {
        auto store = Open("v1");
        ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
    }
    const std::string before = testutil::ReadFile(Path());
    {
        std::ofstream os(Path(), std::ios::binary | std::ios::app);
        os << "{\"ekey\":\"" << KeyFor(2).Hex().substr(0, 10);
    }

    {
        auto store = Open("v1");
        EXPECT_EQ(store->CompletedCount(), 1u);
        EXPECT_FALSE(store->IsCompleted(KeyFor(2)));
        EXPECT_EQ(testutil::ReadFile(Path()), before);

        ASSERT_TRUE(store->RecordCompleted(KeyFor(3)).ok);
    }
    auto store = Open("v1");
    EXPECT_EQ(store->CompletedCount(), 2u);
    EXPECT_TRUE(store->IsCompleted(KeyFor(3)));
}

TEST_F(ProgressStoreTests, GarbageFileStartsOver) {
    testutil::WriteFile(Path(), "not json\n{\"ekey\":\"00\"}\n");
    auto store = Open("v1");
    EXPECT_EQ(store->CompletedCount(), 0u);
    EXPECT_EQ(testutil::ReadFile(Path()), "{\"manifest_version\":\"v1\"}\n");
}

TEST_F(ProgressStoreTests, RemoveDeletesFile) {
    auto store = Open("v1");
    ASSERT_TRUE(store->RecordCompleted(KeyFor(1)).ok);
    ASSERT_TRUE(store->Remove().ok);
    EXPECT_FALSE(testutil::FileExists(Path()));
    EXPECT_FALSE(store->RecordCompleted(KeyFor(2)).ok);
}

TEST_F(ProgressStoreTests, ConcurrentRecords) {
    auto store = Open("v1");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i)
                EXPECT_TRUE(store->RecordCompleted(KeyFor(t * 100 + i)).ok);
        });
    }
    for (auto& th : threads)
        th.join();

    auto reopened = Open("v1");
    EXPECT_EQ(reopened->CompletedCount(), 100u);
}

} // namespace
