#include <sluice/streaming/stream_config.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

using namespace sluice;

namespace
{

const char* env_names[] = {
    "SLUICE_MAX_STREAMS",
    "SLUICE_BUFFER_BYTES",
    "SLUICE_BACKPRESSURE_THRESHOLD",
    "SLUICE_ADAPTIVE_BUFFERING",
    "SLUICE_SIZE_REDUCTION",
    "SLUICE_CONTENT_OPTIMIZATION",
    "SLUICE_WORKER_POOL_SIZE",
    "SLUICE_GRACE_PERIOD_MS",
};

class StreamConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        for (auto name : env_names)
            ::unsetenv(name);
    }
};

} // namespace

TEST(StreamConfig, Defaults)
{
    stream_config config;
    EXPECT_EQ(config.max_concurrent_streams, 150u);
    EXPECT_EQ(config.buffer_byte_budget, 65536u);
    EXPECT_DOUBLE_EQ(config.backpressure_threshold, 0.8);
    EXPECT_TRUE(config.adaptive_buffering);
    EXPECT_FALSE(config.size_reduction_enabled);
    EXPECT_FALSE(config.content_optimization_enabled);
    EXPECT_EQ(config.worker_pool_size, 4u);
    EXPECT_EQ(config.adaptive_delay_cap.count(), 100);
    EXPECT_EQ(config.metrics_grace_period.count(), 1000);
    EXPECT_TRUE(config.is_valid());
}

TEST(StreamConfig, DeactivationThreshold)
{
    stream_config config;
    EXPECT_NEAR(config.deactivation_threshold(), 0.56, 1e-12);
}

TEST(StreamConfig, RejectsInvalidValues)
{
    stream_config zero_streams;
    zero_streams.max_concurrent_streams = 0;
    EXPECT_FALSE(zero_streams.is_valid());
    EXPECT_THROW(zero_streams.validate(), std::invalid_argument);

    stream_config tiny_buffer;
    tiny_buffer.buffer_byte_budget = 512;
    EXPECT_FALSE(tiny_buffer.is_valid());

    stream_config bad_threshold;
    bad_threshold.backpressure_threshold = 1.5;
    EXPECT_FALSE(bad_threshold.is_valid());
    bad_threshold.backpressure_threshold = 0.0;
    EXPECT_FALSE(bad_threshold.is_valid());

    stream_config bad_factor;
    bad_factor.hysteresis_factor = 1.0;
    EXPECT_FALSE(bad_factor.is_valid());
}

TEST(StreamConfigBuilder, BuildsValidConfig)
{
    auto config = stream_config_builder()
        .with_max_concurrent_streams(10)
        .with_buffer_budget(32 * 1024)
        .with_backpressure_threshold(0.75)
        .with_size_reduction(true, 4096)
        .with_content_optimization(true)
        .with_grace_period(std::chrono::milliseconds(250))
        .build();

    EXPECT_EQ(config.max_concurrent_streams, 10u);
    EXPECT_EQ(config.buffer_byte_budget, 32u * 1024u);
    EXPECT_DOUBLE_EQ(config.backpressure_threshold, 0.75);
    EXPECT_TRUE(config.size_reduction_enabled);
    EXPECT_EQ(config.size_reduction_min_bytes, 4096u);
    EXPECT_TRUE(config.content_optimization_enabled);
    EXPECT_EQ(config.metrics_grace_period.count(), 250);
}

TEST(StreamConfigBuilder, BuildValidates)
{
    EXPECT_THROW(stream_config_builder().with_max_concurrent_streams(0).build(), std::invalid_argument);
}

TEST_F(StreamConfigEnvTest, UnsetEnvironmentKeepsBase)
{
    stream_config base;
    base.max_concurrent_streams = 42;
    auto config = load_stream_config_from_env(base);
    EXPECT_EQ(config.max_concurrent_streams, 42u);
    EXPECT_EQ(config.buffer_byte_budget, base.buffer_byte_budget);
}

TEST_F(StreamConfigEnvTest, OverlaysEnvironment)
{
    ::setenv("SLUICE_MAX_STREAMS", "200", 1);
    ::setenv("SLUICE_BUFFER_BYTES", "131072", 1);
    ::setenv("SLUICE_BACKPRESSURE_THRESHOLD", "0.9", 1);
    ::setenv("SLUICE_ADAPTIVE_BUFFERING", "false", 1);
    ::setenv("SLUICE_SIZE_REDUCTION", "on", 1);
    ::setenv("SLUICE_CONTENT_OPTIMIZATION", "1", 1);
    ::setenv("SLUICE_WORKER_POOL_SIZE", "8", 1);
    ::setenv("SLUICE_GRACE_PERIOD_MS", "2500", 1);

    auto config = load_stream_config_from_env();
    EXPECT_EQ(config.max_concurrent_streams, 200u);
    EXPECT_EQ(config.buffer_byte_budget, 131072u);
    EXPECT_DOUBLE_EQ(config.backpressure_threshold, 0.9);
    EXPECT_FALSE(config.adaptive_buffering);
    EXPECT_TRUE(config.size_reduction_enabled);
    EXPECT_TRUE(config.content_optimization_enabled);
    EXPECT_EQ(config.worker_pool_size, 8u);
    EXPECT_EQ(config.metrics_grace_period.count(), 2500);
}

TEST_F(StreamConfigEnvTest, RejectsMalformedValues)
{
    ::setenv("SLUICE_MAX_STREAMS", "lots", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);

    ::setenv("SLUICE_MAX_STREAMS", "-3", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);

    ::setenv("SLUICE_MAX_STREAMS", "12abc", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);

    ::unsetenv("SLUICE_MAX_STREAMS");
    ::setenv("SLUICE_ADAPTIVE_BUFFERING", "maybe", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);
}

TEST_F(StreamConfigEnvTest, RejectsInvalidResult)
{
    ::setenv("SLUICE_MAX_STREAMS", "0", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);
}

TEST_F(StreamConfigEnvTest, RejectsSignedOrPaddedSizes)
{
    for (const char* value : {" -1", "\t5", "+5", " 10"})
    {
        ::setenv("SLUICE_MAX_STREAMS", value, 1);
        EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument) << "'" << value << "'";
    }

    ::unsetenv("SLUICE_MAX_STREAMS");
    ::setenv("SLUICE_BUFFER_BYTES", " -1", 1);
    EXPECT_THROW(load_stream_config_from_env(), std::invalid_argument);
}
