#include <gtest/gtest.h>
#include "engine/Preflight.hpp"
#include "engine/ReservationLedger.hpp"
#include "types/JobSpec.hpp"
#include "TestVolumes.hpp"

using namespace bh::engine;
using namespace bh::types;
using namespace bh::test;
using namespace std::chrono;

namespace {
constexpr uint64_t MiB = 1024 * 1024;
constexpr uint64_t GiB = 1024 * MiB;
}

class PreflightTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<FixedSpaceVolume> volume = std::make_shared<FixedSpaceVolume>(10 * GiB);
    std::shared_ptr<InProcessReservationLedger> ledger = std::make_shared<InProcessReservationLedger>();
    JobSpec spec;

    void SetUp() override {
        writeFile(tmp / "src/data.bin", patternBytes(100000));
        spec.id = "nightly";
        spec.sources = {tmp / "src/data.bin"};
        spec.destination = tmp / "backup";
    }

    [[nodiscard]] PreflightChecker checker() const { return {volume, ledger}; }

    static steady_clock::time_point later() { return steady_clock::now() + hours(1); }
};

TEST_F(PreflightTest, PassesAndReservesJobSize) {
    const auto result = checker().check("exec-1", spec, 0, later());

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.manifest.size(), 1u);
    EXPECT_EQ(result.manifest.totalBytes(), 100000u);
    EXPECT_EQ(result.manifest.entries[0].destination, tmp / "backup/data.bin");
    EXPECT_EQ(ledger->reservedBy("exec-1"), 100000u);
}

TEST_F(PreflightTest, InsufficientSpaceIsPreflightFailure) {
    volume->setFreeSpace(500 * MiB);

    const auto result = checker().check("exec-1", spec, 0, later());

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, Failure::Kind::INSUFFICIENT_SPACE);
    EXPECT_EQ(result.failure->category(), Failure::Category::PREFLIGHT);
    EXPECT_EQ(ledger->queryConcurrentReservations(), 0u);
}

TEST_F(PreflightTest, MinimumFreeSpaceMustRemainAfterJob) {
    volume->setFreeSpace(GiB + 99999);
    EXPECT_FALSE(checker().check("exec-1", spec, 0, later()).ok());

    volume->setFreeSpace(GiB + 100000);
    EXPECT_TRUE(checker().check("exec-1", spec, 0, later()).ok());
}

TEST_F(PreflightTest, ReservationsOfOtherExecutionsCount) {
    volume->setFreeSpace(3 * GiB);
    ASSERT_TRUE(ledger->reserveSpace("other", 2 * GiB, 3 * GiB, 0));

    EXPECT_FALSE(checker().check("exec-1", spec, 0, later()).ok());

    ledger->releaseSpace("other");
    EXPECT_TRUE(checker().check("exec-1", spec, 0, later()).ok());
}

TEST_F(PreflightTest, DurableBytesAreNotReservedAgain) {
    const auto result = checker().check("exec-1", spec, 40000, later());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(ledger->reservedBy("exec-1"), 60000u);
}

TEST_F(PreflightTest, ReleaseDropsReservation) {
    const auto pf = checker();
    ASSERT_TRUE(pf.check("exec-1", spec, 0, later()).ok());
    pf.release("exec-1");
    EXPECT_EQ(ledger->queryConcurrentReservations(), 0u);
}

TEST_F(PreflightTest, MissingSourceIsUnreachable) {
    spec.sources = {tmp / "src/missing.bin"};
    const auto result = checker().check("exec-1", spec, 0, later());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, Failure::Kind::UNREACHABLE);
    EXPECT_EQ(result.failure->category(), Failure::Category::PREFLIGHT);
}

TEST_F(PreflightTest, UnwritableDestinationIsPermissionDenied) {
    const auto readOnly = std::make_shared<ReadOnlyDestinationVolume>();
    const PreflightChecker pf(readOnly, ledger);

    const auto result = pf.check("exec-1", spec, 0, later());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, Failure::Kind::PERMISSION_DENIED);
}

TEST_F(PreflightTest, PastDeadlineTimesOut) {
    const auto result = checker().check("exec-1", spec, 0, steady_clock::now() - seconds(1));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, Failure::Kind::TIMEOUT);
    EXPECT_EQ(ledger->queryConcurrentReservations(), 0u);
}

TEST_F(PreflightTest, DirectorySourcesKeepTheirStructure) {
    writeFile(tmp / "docs/b.txt", patternBytes(10));
    writeFile(tmp / "docs/a.txt", patternBytes(20));
    writeFile(tmp / "docs/sub/c.txt", patternBytes(30));
    spec.sources = {tmp / "docs", tmp / "src/data.bin"};

    const auto result = checker().check("exec-1", spec, 0, later());
    ASSERT_TRUE(result.ok());

    const auto& entries = result.manifest.entries;
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].destination, tmp / "backup/docs/a.txt");
    EXPECT_EQ(entries[1].destination, tmp / "backup/docs/b.txt");
    EXPECT_EQ(entries[2].destination, tmp / "backup/docs/sub/c.txt");
    EXPECT_EQ(entries[3].destination, tmp / "backup/data.bin");
    EXPECT_EQ(result.manifest.totalBytes(), 100060u);
}

TEST(ManifestTest, LocateMapsStreamOffsets) {
    Manifest m;
    m.entries = {{"a", "A", 100, {}}, {"b", "B", 0, {}}, {"c", "C", 50, {}}};

    EXPECT_EQ(m.startOffset(2), 100u);
    EXPECT_EQ(m.locate(0), std::make_pair(std::size_t{0}, uint64_t{0}));
    EXPECT_EQ(m.locate(99), std::make_pair(std::size_t{0}, uint64_t{99}));
    EXPECT_EQ(m.locate(100), std::make_pair(std::size_t{2}, uint64_t{0}));
    EXPECT_EQ(m.locate(149), std::make_pair(std::size_t{2}, uint64_t{49}));
    EXPECT_EQ(m.locate(150), std::make_pair(std::size_t{3}, uint64_t{0}));
}

TEST_F(PreflightTest, IncrementalSkipsUpToDateDestinations) {
    writeFile(tmp / "src/older.bin", patternBytes(300));
    writeFile(tmp / "src/newer.bin", patternBytes(200));
    writeFile(tmp / "backup/older.bin", patternBytes(300));
    writeFile(tmp / "backup/newer.bin", patternBytes(10));

    const auto stamp = fs::last_write_time(tmp / "src/older.bin");
    fs::last_write_time(tmp / "backup/older.bin", stamp);
    fs::last_write_time(tmp / "backup/newer.bin", stamp - minutes(5));
    fs::last_write_time(tmp / "src/newer.bin", stamp);

    spec.type = JobSpec::Type::INCREMENTAL;
    spec.sources = {tmp / "src/older.bin", tmp / "src/newer.bin", tmp / "src/data.bin"};

    const auto manifest = resolveManifest(spec, *volume);
    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest.entries[0].source, tmp / "src/newer.bin");
    EXPECT_EQ(manifest.entries[0].modified, stamp);
    EXPECT_EQ(manifest.entries[1].source, tmp / "src/data.bin");

    spec.type = JobSpec::Type::FULL;
    EXPECT_EQ(resolveManifest(spec, *volume).size(), 3u);
}

TEST_F(PreflightTest, PinnedManifestKeepsItsFileSet) {
    spec.type = JobSpec::Type::INCREMENTAL;
    const auto first = checker().check("exec-1", spec, 0, later());
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first.manifest.size(), 1u);

    // A partly written destination looks newer than its source
    writeFile(tmp / "backup/data.bin", patternBytes(100));
    EXPECT_EQ(resolveManifest(spec, *volume).size(), 0u);

    const auto retry = checker().check("exec-1", spec, 100, later(), &first.manifest);
    ASSERT_TRUE(retry.ok());
    ASSERT_EQ(retry.manifest.size(), 1u);
    EXPECT_EQ(retry.manifest.totalBytes(), 100000u);

    fs::remove(tmp / "src/data.bin");
    const auto gone = checker().check("exec-1", spec, 100, later(), &first.manifest);
    ASSERT_FALSE(gone.ok());
    EXPECT_EQ(gone.failure->kind, Failure::Kind::UNREACHABLE);
}

TEST(ReservationLedgerTest, ReplacesOwnReservation) {
    InProcessReservationLedger ledger;
    ASSERT_TRUE(ledger.reserveSpace("a", 100, 1000, 0));
    ASSERT_TRUE(ledger.reserveSpace("a", 300, 1000, 0));
    EXPECT_EQ(ledger.queryConcurrentReservations(), 300u);
    EXPECT_FALSE(ledger.reserveSpace("b", 800, 1000, 0));
    EXPECT_TRUE(ledger.reserveSpace("b", 700, 1000, 0));
    EXPECT_EQ(ledger.queryConcurrentReservations(), 1000u);
}
