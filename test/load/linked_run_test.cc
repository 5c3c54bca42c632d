#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/load/load_test_driver.h"
#include "mock_storage_client.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

#include <glog/logging.h>

using namespace KvLoad;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

// Passes calls through to a store and checks, on every read, that the linked
// writer had already moved far enough past the key.
class WindowCheckingClient : public StorageClient {
public:
    WindowCheckingClient(StorageClient* target, const KeyRange& range, int64_t window)
        : target_(target), range_(range), window_(window) {}

    void Watch(const WriteProgressView* writer) { writer_ = writer; }

    absl::Status Write(int64_t key, const ColumnMap& columns) override {
        return target_->Write(key, columns);
    }

    absl::StatusOr<std::optional<ColumnMap>> Read(int64_t key) override {
        if (writer_ != nullptr) {
            const int64_t watermark = writer_->Watermark();
            const bool safe = writer_->Finished() || watermark >= range_.end - 1 ||
                watermark >= key + window_;
            if (!safe) {
                LOG(ERROR) << "Read of key #" << key << " with watermark " << watermark;
                violations_.fetch_add(1);
            }
        }
        return target_->Read(key);
    }

    int64_t violations() const { return violations_.load(); }

private:
    StorageClient* target_;
    const KeyRange range_;
    const int64_t window_;
    const WriteProgressView* writer_ = nullptr;
    std::atomic<int64_t> violations_{0};
};

GeneratorBounds SmallRecords() {
    GeneratorBounds bounds;
    bounds.min_cols = 1;
    bounds.max_cols = 4;
    bounds.min_size = 8;
    bounds.max_size = 24;
    return bounds;
}

}  // namespace

class LinkedRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        writer_options_.bounds = SmallRecords();
        writer_options_.progress_interval = 0ms;
        reader_options_.bounds = SmallRecords();
        reader_options_.progress_interval = 0ms;
        reader_options_.max_backoff = 5ms;
    }

    WriterOptions writer_options_;
    ReaderOptions reader_options_;
};

TEST_F(LinkedRunTest, ReadersNeverOvertakeTheKeyWindow) {
    const KeyRange range{0, 2000};
    InMemoryStoreOptions store_options;
    store_options.max_op_delay_us = 50;
    InMemoryStore store(store_options);
    WindowCheckingClient client(&store, range, 50);

    WriterEngine writer(&client);
    ReaderEngine reader(&client);
    client.Watch(&writer);
    reader_options_.key_window = 50;

    writer.Configure(writer_options_);
    reader.Configure(reader_options_);
    reader.LinkToWriter(&writer);
    writer.Start(range, 4);
    reader.Start(range, 4);

    ASSERT_TRUE(writer.WaitForFinish().ok());
    ReadResult result = reader.WaitForFinish();

    EXPECT_EQ(client.violations(), 0);
    EXPECT_FALSE(result.aborted());
    EXPECT_EQ(result.stats.keys_read, 2000);
    EXPECT_EQ(result.stats.verified, 2000);
    EXPECT_EQ(result.stats.errors, 0);
}

TEST_F(LinkedRunTest, ReadersSkipKeysTheWriterFailed) {
    InMemoryStore store;
    NiceMock<MockStorageClient> client;
    client.DelegateTo(&store);
    ON_CALL(client, Write(250, _)).WillByDefault(Return(absl::UnavailableError("rejected")));

    WriterEngine writer(&client);
    ReaderEngine reader(&client);
    reader_options_.key_window = 10;
    writer.Configure(writer_options_);
    reader.Configure(reader_options_);
    reader.LinkToWriter(&writer);
    writer.Start({0, 500}, 3);
    reader.Start({0, 500}, 3);

    EXPECT_FALSE(writer.WaitForFinish().ok());
    ReadResult result = reader.WaitForFinish();

    EXPECT_EQ(writer.Watermark(), 249);
    EXPECT_EQ(result.stats.skipped, 1);
    EXPECT_EQ(result.stats.keys_read, 499);
    EXPECT_EQ(result.stats.errors, 0);
}

class LoadTestDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.range = {100, 600};
        options_.writer_threads = 3;
        options_.reader_threads = 3;
        options_.writer.bounds = SmallRecords();
        options_.writer.progress_interval = 0ms;
        options_.reader.bounds = SmallRecords();
        options_.reader.progress_interval = 0ms;
        options_.reader.max_backoff = 5ms;
    }

    InMemoryStore store_;
    LoadTestOptions options_;
};

TEST_F(LoadTestDriverTest, ConcurrentWriteAndVerify) {
    options_.write = true;
    options_.read = true;
    options_.reader.key_window = 20;

    LoadTestReport report = LoadTestDriver(&store_).Run(options_);

    EXPECT_TRUE(report.Succeeded());
    EXPECT_TRUE(report.write_status.ok());
    EXPECT_EQ(report.watermark, 599);
    EXPECT_EQ(report.writer_stats.keys_written, 500);
    EXPECT_EQ(report.read_result.stats.verified, 500);
    EXPECT_EQ(store_.size(), 500u);
}

TEST_F(LoadTestDriverTest, ReaderUsesWriterBoundsWhenWriting) {
    options_.write = true;
    options_.read = true;
    options_.reader.bounds.min_cols = 7;
    options_.reader.bounds.max_cols = 9;

    LoadTestReport report = LoadTestDriver(&store_).Run(options_);
    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(report.read_result.stats.errors, 0);
}

TEST_F(LoadTestDriverTest, SeparateWriteThenReadPasses) {
    LoadTestDriver driver(&store_);

    options_.write = true;
    LoadTestReport write_report = driver.Run(options_);
    EXPECT_TRUE(write_report.Succeeded());
    EXPECT_FALSE(write_report.read);

    options_.write = false;
    options_.read = true;
    LoadTestReport read_report = driver.Run(options_);
    EXPECT_TRUE(read_report.Succeeded());
    EXPECT_FALSE(read_report.wrote);
    EXPECT_EQ(read_report.read_result.stats.verified, 500);
}

TEST_F(LoadTestDriverTest, ReadOfMissingDataFails) {
    options_.read = true;
    options_.reader.max_errors = 10;

    LoadTestReport report = LoadTestDriver(&store_).Run(options_);
    EXPECT_FALSE(report.Succeeded());
    EXPECT_TRUE(report.read_result.aborted());
    EXPECT_GE(report.read_result.stats.errors, 11);
}

TEST_F(LoadTestDriverTest, RejectsBadOptionsBeforeAnyWorkerStarts) {
    MockStorageClient client;
    EXPECT_CALL(client, Write(_, _)).Times(0);
    EXPECT_CALL(client, Read(_)).Times(0);
    LoadTestDriver driver(&client);

    options_.write = true;
    options_.read = true;
    options_.reader_threads = 0;
    EXPECT_THROW(driver.Run(options_), std::invalid_argument);

    options_.reader_threads = 3;
    options_.writer_threads = 0;
    EXPECT_THROW(driver.Run(options_), std::invalid_argument);

    options_.writer_threads = 3;
    options_.range = {600, 600};
    EXPECT_THROW(driver.Run(options_), std::invalid_argument);

    options_.range = {100, 600};
    options_.reader.verify_percent = 101;
    EXPECT_THROW(driver.Run(options_), std::invalid_argument);
}

TEST_F(LoadTestDriverTest, RequiresWriteOrRead) {
    EXPECT_THROW(LoadTestDriver(&store_).Run(options_), std::invalid_argument);
}
