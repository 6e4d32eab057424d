#include "blte/blte_encoder.hpp"
#include "blte/espec.hpp"
#include "casc/archive_store.hpp"
#include "testing.hpp"
#include "util/path_utils.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

using namespace ngdp::casc;

struct Blob {
    ngdp::EKey ekey;
    std::vector<std::uint8_t> encoded;
};

Blob MakeBlob(size_t n, std::uint32_t seed) {
    ngdp::EmptyKeyStore keys;
    Blob b;
    auto spec = ngdp::blte::ParseEspec("b:{*=n}");
    EXPECT_TRUE(spec.has_value());
    EXPECT_TRUE(ngdp::blte::BlteEncoder(keys).Encode(testutil::Pattern(n, seed), *spec, b.encoded).ok);
    EXPECT_TRUE(ngdp::blte::ComputeEKey(b.encoded, b.ekey).ok);
    return b;
}

class ArchiveStoreTests : public ::testing::Test {
  protected:
    std::unique_ptr<ArchiveStore> OpenStore(ArchiveStoreOptions opt = {}) {
        std::unique_ptr<ArchiveStore> store;
        auto r = ArchiveStore::Open(Dir(), opt, store);
        EXPECT_TRUE(r.ok) << r.msg;
        return store;
    }

    std::string Dir() const { return tmp.Path() + "/Data/data"; }
    std::string DataPath(std::uint32_t id) const { return ngdp::JoinPath(Dir(), ngdp::DataFileName(id)); }

    testutil::TemporaryDirectory tmp;
};

TEST_F(ArchiveStoreTests, AppendThenRead) {
    auto store = OpenStore();
    ASSERT_TRUE(store);
    const Blob b = MakeBlob(1000, 1);

    ArchiveLocation loc;
    auto r = store->Append(b.ekey, b.encoded, &loc);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(loc.archive_id, 0u);
    EXPECT_EQ(loc.offset, 0u);
    EXPECT_EQ(loc.size, kEntryHeaderSize + b.encoded.size());
    EXPECT_EQ(testutil::FileSize(DataPath(0)), loc.size);

    std::vector<std::uint8_t> out;
    r = store->Read(b.ekey, out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out, b.encoded);
    EXPECT_TRUE(store->Contains(b.ekey));

    const Blob missing = MakeBlob(10, 99);
    EXPECT_EQ(store->Read(missing.ekey, out).code, ngdp::ErrorCode::NotFound);

    auto found = store->Lookup(b.ekey);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, loc);
    EXPECT_FALSE(store->Lookup(missing.ekey).has_value());
}

TEST_F(ArchiveStoreTests, DuplicateAppendKeepsFirstCopy) {
    auto store = OpenStore();
    const Blob b = MakeBlob(500, 2);
    ArchiveLocation first, second;
    ASSERT_TRUE(store->Append(b.ekey, b.encoded, &first).ok);
    ASSERT_TRUE(store->Append(b.ekey, b.encoded, &second).ok);
    EXPECT_EQ(first, second);
    EXPECT_EQ(testutil::FileSize(DataPath(0)), first.size);
    EXPECT_EQ(store->Index().Size(), 1u);
}

TEST_F(ArchiveStoreTests, SurvivesReopen) {
    std::vector<Blob> blobs;
    for (std::uint32_t i = 0; i < 20; ++i)
        blobs.push_back(MakeBlob(200 + i * 37, i + 10));
    {
        auto store = OpenStore();
        for (const auto& b : blobs)
            ASSERT_TRUE(store->Append(b.ekey, b.encoded).ok);
    }

    auto store = OpenStore();
    EXPECT_EQ(store->Index().Size(), blobs.size());
    for (const auto& b : blobs) {
        std::vector<std::uint8_t> out;
        auto r = store->Read(b.ekey, out);
        ASSERT_TRUE(r.ok) << r.msg;
        EXPECT_EQ(out, b.encoded);
    }
}

TEST_F(ArchiveStoreTests, RollsOverToNextDataFile) {
    ArchiveStoreOptions opt;
    opt.max_data_file_size = 1000;
    auto store = OpenStore(opt);

    const Blob a = MakeBlob(600, 1);
    const Blob b = MakeBlob(600, 2);
    ArchiveLocation la, lb;
    ASSERT_TRUE(store->Append(a.ekey, a.encoded, &la).ok);
    ASSERT_TRUE(store->Append(b.ekey, b.encoded, &lb).ok);
    EXPECT_EQ(la.archive_id, 0u);
    EXPECT_EQ(lb.archive_id, 1u);
    EXPECT_EQ(lb.offset, 0u);
    EXPECT_TRUE(testutil::FileExists(DataPath(1)));

    const Blob huge = MakeBlob(2000, 3);
    EXPECT_EQ(store->Append(huge.ekey, huge.encoded).code, ngdp::ErrorCode::InvalidArgument);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(store->Read(a.ekey, out).ok);
    EXPECT_EQ(out, a.encoded);
}

TEST_F(ArchiveStoreTests, RejectsBadOptions) {
    ArchiveStoreOptions opt;
    opt.max_data_file_size = 10;
    std::unique_ptr<ArchiveStore> store;
    EXPECT_EQ(ArchiveStore::Open(Dir(), opt, store).code, ngdp::ErrorCode::InvalidArgument);
    EXPECT_FALSE(store);
}

TEST_F(ArchiveStoreTests, OpenTrimsOrphanedTail) {
    const Blob b = MakeBlob(300, 4);
    std::uint64_t indexed_size = 0;
    {
        auto store = OpenStore();
        ArchiveLocation loc;
        ASSERT_TRUE(store->Append(b.ekey, b.encoded, &loc).ok);
        indexed_size = loc.size;
    }
    {
        std::ofstream os(DataPath(0), std::ios::binary | std::ios::app);
        os << std::string(77, 'z');
    }
    ASSERT_EQ(testutil::FileSize(DataPath(0)), indexed_size + 77);

    // Without recovery the tail is left for inspection.
    {
        ArchiveStoreOptions opt;
        opt.recover = false;
        auto store = OpenStore(opt);
        EXPECT_EQ(testutil::FileSize(DataPath(0)), indexed_size + 77);
    }

    auto store = OpenStore();
    EXPECT_EQ(testutil::FileSize(DataPath(0)), indexed_size);
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(store->Read(b.ekey, out).ok);

    // The next append lands right after the surviving entry.
    const Blob next = MakeBlob(50, 5);
    ArchiveLocation loc;
    ASSERT_TRUE(store->Append(next.ekey, next.encoded, &loc).ok);
    EXPECT_EQ(loc.offset, indexed_size);
}

TEST_F(ArchiveStoreTests, OpenDropsEntriesPastEndOfFile) {
    const Blob a = MakeBlob(300, 6);
    const Blob b = MakeBlob(300, 7);
    ArchiveLocation la;
    {
        auto store = OpenStore();
        ASSERT_TRUE(store->Append(a.ekey, a.encoded, &la).ok);
        ASSERT_TRUE(store->Append(b.ekey, b.encoded).ok);
    }
    ASSERT_EQ(::truncate(DataPath(0).c_str(), static_cast<off_t>(la.size + 10)), 0);

    {
        auto store = OpenStore();
        EXPECT_TRUE(store->Contains(a.ekey));
        EXPECT_FALSE(store->Contains(b.ekey));
        EXPECT_EQ(testutil::FileSize(DataPath(0)), la.size);
    }

    // The dropped entry stays dropped after another reopen.
    auto store = OpenStore();
    EXPECT_FALSE(store->Contains(b.ekey));
    ASSERT_TRUE(store->Append(b.ekey, b.encoded).ok);
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(store->Read(b.ekey, out).ok);
    EXPECT_EQ(out, b.encoded);
}

TEST_F(ArchiveStoreTests, DetectsCorruptedPayload) {
    const Blob b = MakeBlob(400, 8);
    ArchiveLocation loc;
    {
        auto store = OpenStore();
        ASSERT_TRUE(store->Append(b.ekey, b.encoded, &loc).ok);
    }
    {
        std::fstream fs(DataPath(0), std::ios::binary | std::ios::in | std::ios::out);
        const auto pos = static_cast<std::streamoff>(loc.offset + kEntryHeaderSize + b.encoded.size() - 5);
        fs.seekg(pos);
        const char c = static_cast<char>(fs.get());
        fs.seekp(pos);
        fs.put(static_cast<char>(c ^ 0x5a));
    }

    ArchiveStoreOptions opt;
    opt.verify_on_read = true;
    auto store = OpenStore(opt);
    std::vector<std::uint8_t> out;
    EXPECT_EQ(store->Read(b.ekey, out).code, ngdp::ErrorCode::CorruptArchive);

    const VerifyReport report = store->VerifyAll();
    EXPECT_EQ(report.checked, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
}

TEST_F(ArchiveStoreTests, DetectsDamagedEntryHeader) {
    const Blob b = MakeBlob(100, 9);
    ArchiveLocation loc;
    {
        auto store = OpenStore();
        ASSERT_TRUE(store->Append(b.ekey, b.encoded, &loc).ok);
    }
    {
        std::fstream fs(DataPath(0), std::ios::binary | std::ios::in | std::ios::out);
        fs.seekp(static_cast<std::streamoff>(loc.offset + 17));
        fs.put('\x7f');
    }
    auto store = OpenStore();
    std::vector<std::uint8_t> out;
    EXPECT_EQ(store->Read(b.ekey, out).code, ngdp::ErrorCode::CorruptArchive);
}

TEST_F(ArchiveStoreTests, ConcurrentAppends) {
    auto store = OpenStore();
    std::vector<Blob> blobs;
    for (std::uint32_t i = 0; i < 64; ++i)
        blobs.push_back(MakeBlob(100 + i, 100 + i));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (size_t i = static_cast<size_t>(t); i < blobs.size(); i += 4) {
                EXPECT_TRUE(store->Append(blobs[i].ekey, blobs[i].encoded).ok);
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(store->Index().Size(), blobs.size());
    std::uint64_t total = 0;
    for (const auto& b : blobs) {
        std::vector<std::uint8_t> out;
        ASSERT_TRUE(store->Read(b.ekey, out).ok);
        EXPECT_EQ(out, b.encoded);
        total += kEntryHeaderSize + b.encoded.size();
    }
    EXPECT_EQ(testutil::FileSize(DataPath(0)), total);
    EXPECT_TRUE(store->VerifyAll().failures.empty());
}

} // namespace
