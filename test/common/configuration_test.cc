#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

using namespace KvLoad;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("KVLOAD_NUM_KEYS");
        unsetenv("KVLOAD_READ");
        unsetenv("KVLOAD_TABLE_NAME");
        unsetenv("KVLOAD_VERIFY_PERCENT");
    }

    static bool HasError(const Configuration& configuration, const std::string& fragment) {
        auto errors = configuration.getValidationErrors();
        return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
            return e.find(fragment) != std::string::npos;
        });
    }

    Configuration configuration_;
};

TEST_F(ConfigurationTest, DefaultsMatchTheCommandLineTool) {
    const KvLoadConfig& config = configuration_.config();
    EXPECT_EQ(config.workload.start_key.get(), 0);
    EXPECT_EQ(config.workload.table_name.get(), "cluster_test");
    EXPECT_EQ(config.workload.column_family.get(), "test_cf");
    EXPECT_EQ(config.writer.threads.get(), 20);
    EXPECT_EQ(config.reader.threads.get(), 20);
    EXPECT_EQ(config.reader.max_read_errors.get(), 10);
    EXPECT_EQ(config.reader.key_window.get(), 0);
    EXPECT_FALSE(config.writer.multi_put.get());
}

TEST_F(ConfigurationTest, LoadsYamlSections) {
    ASSERT_TRUE(configuration_.loadFromString(R"(
kvload:
  workload:
    start_key: 1000
    num_keys: 500
    table_name: load_table
  writer:
    enabled: true
    threads: 4
    avg_columns: 3
    avg_data_size: 64
    multi_put: true
  reader:
    enabled: true
    verify_percent: 50
    key_window: 10
  store:
    num_shards: 8
)"));
    const KvLoadConfig& config = configuration_.config();
    EXPECT_EQ(config.workload.start_key.get(), 1000);
    EXPECT_EQ(config.workload.num_keys.get(), 500);
    EXPECT_EQ(config.workload.table_name.get(), "load_table");
    EXPECT_TRUE(config.writer.enabled.get());
    EXPECT_EQ(config.writer.threads.get(), 4);
    EXPECT_EQ(config.writer.avg_columns.get(), 3);
    EXPECT_EQ(config.writer.avg_data_size.get(), 64u);
    EXPECT_TRUE(config.writer.multi_put.get());
    EXPECT_EQ(config.reader.verify_percent.get(), 50);
    EXPECT_EQ(config.reader.key_window.get(), 10);
    EXPECT_EQ(config.store.num_shards.get(), 8u);
    EXPECT_TRUE(configuration_.validate());
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(configuration_.loadFromString("kvload: [unterminated"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(configuration_.loadFromString("kvload:\n  workload:\n    num_keys: 10\n    table_name: t1\n"));
    setenv("KVLOAD_NUM_KEYS", "77", 1);
    setenv("KVLOAD_TABLE_NAME", "from_env", 1);
    EXPECT_EQ(configuration_.config().workload.num_keys.get(), 77);
    EXPECT_EQ(configuration_.config().workload.table_name.get(), "from_env");
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBackToValue) {
    configuration_.config().workload.num_keys.set(10);
    setenv("KVLOAD_NUM_KEYS", "lots", 1);
    EXPECT_EQ(configuration_.config().workload.num_keys.get(), 10);
}

TEST_F(ConfigurationTest, BooleanEnvironmentValues) {
    setenv("KVLOAD_READ", "yes", 1);
    EXPECT_TRUE(configuration_.config().reader.enabled.get());
    setenv("KVLOAD_READ", "off", 1);
    EXPECT_FALSE(configuration_.config().reader.enabled.get());
}

TEST_F(ConfigurationTest, OverrideBeatsEnvironment) {
    ConfigValue<int>& verify_percent = configuration_.config().reader.verify_percent;
    verify_percent.set(30);
    setenv("KVLOAD_VERIFY_PERCENT", "0", 1);
    EXPECT_EQ(verify_percent.get(), 0);

    verify_percent.setOverride(50);
    EXPECT_EQ(verify_percent.get(), 50);

    verify_percent.clearOverride();
    EXPECT_EQ(verify_percent.get(), 0);
    unsetenv("KVLOAD_VERIFY_PERCENT");
    EXPECT_EQ(verify_percent.get(), 30);
}

TEST_F(ConfigurationTest, OverrideSurvivesFileLoad) {
    configuration_.config().workload.num_keys.setOverride(5);
    ASSERT_TRUE(configuration_.loadFromString("kvload:\n  workload:\n    num_keys: 10\n"));
    EXPECT_EQ(configuration_.config().workload.num_keys.get(), 5);
}

TEST_F(ConfigurationTest, RequiresWriteOrRead) {
    configuration_.config().workload.num_keys.set(10);
    EXPECT_FALSE(configuration_.validate());
    EXPECT_TRUE(HasError(configuration_, "write or read"));

    configuration_.config().reader.enabled.set(true);
    EXPECT_TRUE(configuration_.validate());
}

TEST_F(ConfigurationTest, RejectsInvalidValues) {
    KvLoadConfig& config = configuration_.config();
    config.writer.enabled.set(true);
    config.workload.start_key.set(-1);
    config.workload.num_keys.set(0);
    config.writer.threads.set(0);
    config.reader.verify_percent.set(101);
    config.reader.key_window.set(-5);
    config.coordination.min_backoff_ms.set(50);
    config.coordination.max_backoff_ms.set(10);

    EXPECT_FALSE(configuration_.validate());
    EXPECT_TRUE(HasError(configuration_, "Start key"));
    EXPECT_TRUE(HasError(configuration_, "Number of keys"));
    EXPECT_TRUE(HasError(configuration_, "Writer threads"));
    EXPECT_TRUE(HasError(configuration_, "Verify percent"));
    EXPECT_TRUE(HasError(configuration_, "Key window"));
}

TEST_F(ConfigurationTest, RejectsOversizedAverages) {
    KvLoadConfig& config = configuration_.config();
    config.writer.enabled.set(true);
    config.workload.num_keys.set(10);
    ASSERT_TRUE(configuration_.validate());

    config.writer.avg_columns.set(1500000000);
    config.writer.avg_data_size.set(SIZE_MAX);
    EXPECT_FALSE(configuration_.validate());
    EXPECT_TRUE(HasError(configuration_, "Average columns per key"));
    EXPECT_TRUE(HasError(configuration_, "Average column data size"));

    config.writer.avg_columns.set(static_cast<int>(kMaxGenerationAverage));
    config.writer.avg_data_size.set(static_cast<size_t>(kMaxGenerationAverage));
    EXPECT_TRUE(configuration_.validate());
}

TEST_F(ConfigurationTest, RejectsOverflowingRange) {
    KvLoadConfig& config = configuration_.config();
    config.writer.enabled.set(true);
    config.workload.start_key.set(INT64_MAX - 5);
    config.workload.num_keys.set(10);
    EXPECT_FALSE(configuration_.validate());
    EXPECT_TRUE(HasError(configuration_, "overflow"));
}
