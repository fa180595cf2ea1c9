#include <sluice/streaming/backpressure_controller.hpp>

#include <gtest/gtest.h>

using namespace sluice;
using transition = backpressure_controller::transition;

namespace
{

stream_config budget_config(std::size_t budget = 1000)
{
    stream_config config;
    config.buffer_byte_budget = budget;
    return config;
}

} // namespace

TEST(BackpressureController, StartsIdle)
{
    backpressure_controller bp(budget_config());
    EXPECT_FALSE(bp.is_active());
    EXPECT_DOUBLE_EQ(bp.utilization(), 0.0);
    EXPECT_EQ(bp.adaptive_delay().count(), 0);
}

TEST(BackpressureController, UtilizationIsBufferedOverBudget)
{
    backpressure_controller bp(budget_config(1000));
    bp.evaluate(250);
    EXPECT_DOUBLE_EQ(bp.utilization(), 0.25);
    bp.evaluate(1500);
    EXPECT_DOUBLE_EQ(bp.utilization(), 1.5);
}

TEST(BackpressureController, ActivatesOnlyAboveThreshold)
{
    backpressure_controller bp(budget_config(1000));

    auto at = bp.evaluate(800);
    EXPECT_EQ(at.change, transition::none);
    EXPECT_FALSE(bp.is_active());

    auto above = bp.evaluate(801);
    EXPECT_EQ(above.change, transition::activated);
    EXPECT_TRUE(bp.is_active());
}

TEST(BackpressureController, ReportsActivationEdgeOnce)
{
    backpressure_controller bp(budget_config(1000));

    EXPECT_EQ(bp.evaluate(900).change, transition::activated);
    EXPECT_EQ(bp.evaluate(950).change, transition::none);
    EXPECT_EQ(bp.evaluate(990).change, transition::none);
    EXPECT_TRUE(bp.is_active());
}

TEST(BackpressureController, HoldsActiveJustAboveThreshold)
{
    backpressure_controller bp(budget_config(1000));
    ASSERT_EQ(bp.evaluate(810).change, transition::activated);

    for (int i = 0; i < 20; ++i)
    {
        auto d = bp.evaluate(810);
        EXPECT_EQ(d.change, transition::none);
        EXPECT_TRUE(bp.is_active());
    }
}

TEST(BackpressureController, StaysActiveInsideHysteresisBand)
{
    backpressure_controller bp(budget_config(1000));
    ASSERT_EQ(bp.evaluate(900).change, transition::activated);

    // Between 0.56 and 0.8: no change either way.
    for (std::size_t bytes : {800u, 700u, 600u, 561u, 560u})
    {
        EXPECT_EQ(bp.evaluate(bytes).change, transition::none) << bytes;
        EXPECT_TRUE(bp.is_active()) << bytes;
    }

    auto below = bp.evaluate(559);
    EXPECT_EQ(below.change, transition::deactivated);
    EXPECT_FALSE(bp.is_active());
    EXPECT_EQ(bp.adaptive_delay().count(), 0);
}

TEST(BackpressureController, InactiveBelowBandDoesNothing)
{
    backpressure_controller bp(budget_config(1000));
    EXPECT_EQ(bp.evaluate(100).change, transition::none);
    EXPECT_EQ(bp.evaluate(0).change, transition::none);
}

TEST(BackpressureController, ReactivationCountsAsNewEdge)
{
    backpressure_controller bp(budget_config(1000));
    EXPECT_EQ(bp.evaluate(900).change, transition::activated);
    EXPECT_EQ(bp.evaluate(100).change, transition::deactivated);
    EXPECT_EQ(bp.evaluate(900).change, transition::activated);
}

TEST(BackpressureController, AdaptiveDelayScalesWithOverage)
{
    backpressure_controller bp(budget_config(1000));

    // (0.9 - 0.8) * 200 = 20ms
    auto d = bp.evaluate(900);
    EXPECT_EQ(d.delay.count(), 20);
    EXPECT_EQ(bp.adaptive_delay().count(), 20);

    // (1.0 - 0.8) * 200 = 40ms
    EXPECT_EQ(bp.evaluate(1000).delay.count(), 40);
}

TEST(BackpressureController, AdaptiveDelayIsCapped)
{
    backpressure_controller bp(budget_config(1000));
    // (2.0 - 0.8) * 200 = 240ms, capped at 100ms
    EXPECT_EQ(bp.evaluate(2000).delay.count(), 100);
}

TEST(BackpressureController, NoDelayWithoutAdaptiveBuffering)
{
    auto config = budget_config(1000);
    config.adaptive_buffering = false;
    backpressure_controller bp(config);

    auto d = bp.evaluate(950);
    EXPECT_EQ(d.change, transition::activated);
    EXPECT_EQ(d.delay.count(), 0);
}

TEST(BackpressureController, CustomThresholdMovesBand)
{
    auto config = budget_config(1000);
    config.backpressure_threshold = 0.5;
    backpressure_controller bp(config);

    EXPECT_DOUBLE_EQ(bp.low_threshold(), 0.35);
    EXPECT_EQ(bp.evaluate(510).change, transition::activated);
    EXPECT_EQ(bp.evaluate(360).change, transition::none);
    EXPECT_EQ(bp.evaluate(340).change, transition::deactivated);
}

TEST(BackpressureController, ResetClearsState)
{
    backpressure_controller bp(budget_config(1000));
    bp.evaluate(950);
    ASSERT_TRUE(bp.is_active());

    bp.reset();
    EXPECT_FALSE(bp.is_active());
    EXPECT_DOUBLE_EQ(bp.utilization(), 0.0);
    EXPECT_EQ(bp.adaptive_delay().count(), 0);
}
