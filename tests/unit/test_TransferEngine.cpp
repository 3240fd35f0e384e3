#include <gtest/gtest.h>
#include "engine/TransferEngine.hpp"
#include "TestVolumes.hpp"

#include <boost/crc.hpp>

using namespace bh::engine;
using namespace bh::types;
using namespace bh::test;

class TransferEngineTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path source, destination;
    std::string data;
    std::shared_ptr<bh::storage::Volume> volume = std::make_shared<bh::storage::LocalVolume>();
    CancelToken token = std::make_shared<std::atomic<bool>>(false);

    void SetUp() override {
        source = tmp / "src/data.bin";
        destination = tmp / "dst/data.bin";
        data = patternBytes(100000);
        writeFile(source, data);
    }

    TransferRequest request(const uint64_t chunk, const uint64_t resume = 0) const {
        return {source, destination, data.size(), chunk, resume, false, 0};
    }
};

TEST_F(TransferEngineTest, HundredThousandBytesInThirteenChunks) {
    TransferEngine engine(volume, request(8192), token);

    std::vector<TransferUnit> units;
    while (auto unit = engine.next()) units.push_back(*unit);

    ASSERT_EQ(units.size(), 13u);
    EXPECT_EQ(units.back().length, 1696u);
    EXPECT_EQ(units.back().end(), 100000u);

    uint64_t expected = 0;
    for (const auto& u : units) {
        EXPECT_TRUE(u.success);
        EXPECT_EQ(u.offset, expected);
        expected = u.end();
    }

    EXPECT_TRUE(engine.done());
    EXPECT_FALSE(engine.failure().has_value());
    EXPECT_EQ(engine.flushedOffset(), 100000u);
    EXPECT_EQ(readFile(destination), data);
}

TEST_F(TransferEngineTest, ResumeNeverEmitsBytesBeforeOffset) {
    writeFile(destination, data.substr(0, 16384));

    TransferEngine engine(volume, request(8192, 16384), token);

    std::vector<TransferUnit> units;
    while (auto unit = engine.next()) units.push_back(*unit);

    ASSERT_FALSE(units.empty());
    EXPECT_EQ(units.front().offset, 16384u);
    for (const auto& u : units) EXPECT_GE(u.offset, 16384u);

    EXPECT_TRUE(engine.done());
    EXPECT_EQ(readFile(destination), data);
}

TEST_F(TransferEngineTest, ResumeMismatchWhenDestinationLengthDiffers) {
    writeFile(destination, data.substr(0, 1000));

    TransferEngine engine(volume, request(8192, 16384), token);

    EXPECT_FALSE(engine.next().has_value());
    EXPECT_EQ(engine.state(), TransferEngine::State::FAILED);
    ASSERT_TRUE(engine.failure().has_value());
    EXPECT_EQ(engine.failure()->kind, Failure::Kind::RESUME_MISMATCH);
    EXPECT_EQ(engine.failure()->category(), Failure::Category::RESUME_MISMATCH);
    EXPECT_EQ(fs::file_size(destination), 1000u);
}

TEST_F(TransferEngineTest, ResumeMismatchWhenDestinationMissing) {
    TransferEngine engine(volume, request(8192, 8192), token);

    EXPECT_FALSE(engine.next().has_value());
    ASSERT_TRUE(engine.failure().has_value());
    EXPECT_EQ(engine.failure()->kind, Failure::Kind::RESUME_MISMATCH);
}

TEST_F(TransferEngineTest, CancellationStopsAtChunkBoundary) {
    TransferEngine engine(volume, request(8000), token);

    uint64_t lastEnd = 0;
    while (auto unit = engine.next()) {
        lastEnd = unit->end();
        if (lastEnd == 40000) token->store(true);
    }

    EXPECT_TRUE(engine.cancelled());
    EXPECT_FALSE(engine.failure().has_value());
    EXPECT_EQ(lastEnd, 40000u);
    EXPECT_EQ(engine.flushedOffset(), 40000u);
    EXPECT_EQ(fs::file_size(destination), 40000u);
}

TEST_F(TransferEngineTest, ShortReadReportsLastFlushedOffset) {
    const auto flaky = std::make_shared<FlakyVolume>(1, 50000);
    TransferEngine engine(flaky, request(8192), token);

    std::vector<TransferUnit> units;
    while (auto unit = engine.next()) units.push_back(*unit);

    ASSERT_EQ(units.size(), 7u);
    EXPECT_FALSE(units.back().success);
    EXPECT_EQ(engine.state(), TransferEngine::State::FAILED);
    ASSERT_TRUE(engine.failure().has_value());
    EXPECT_EQ(engine.failure()->kind, Failure::Kind::TRANSFER_IO);
    EXPECT_EQ(engine.failure()->category(), Failure::Category::TRANSFER);
    EXPECT_EQ(engine.flushedOffset(), 6u * 8192u);
}

TEST_F(TransferEngineTest, ChecksumsCoverEachChunk) {
    auto req = request(8192);
    req.checksum = true;
    TransferEngine engine(volume, req, token);

    while (auto unit = engine.next()) {
        ASSERT_TRUE(unit->checksum.has_value());
        boost::crc_32_type crc;
        crc.process_bytes(data.data() + unit->offset, unit->length);
        EXPECT_EQ(*unit->checksum, crc.checksum());
    }
    EXPECT_TRUE(engine.done());
}

TEST_F(TransferEngineTest, EmptyFileCompletesWithoutUnits) {
    const auto empty = tmp / "src/empty.bin";
    writeFile(empty, "");

    TransferEngine engine(volume, {empty, tmp / "dst/empty.bin", 0, 8192, 0, false, 0}, token);

    EXPECT_FALSE(engine.next().has_value());
    EXPECT_TRUE(engine.done());
    EXPECT_TRUE(fs::exists(tmp / "dst/empty.bin"));
}

TEST_F(TransferEngineTest, SequenceIsNotRestartable) {
    TransferEngine engine(volume, request(65536), token);
    while (engine.next()) {}
    EXPECT_TRUE(engine.done());
    EXPECT_FALSE(engine.next().has_value());
}

TEST_F(TransferEngineTest, RejectsZeroChunkSize) {
    EXPECT_THROW({ TransferEngine engine(volume, request(0), token); }, std::invalid_argument);
}
