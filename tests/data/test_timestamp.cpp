#include "hubtrace/data/timestamp.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace hubtrace::data;
using hubtrace::test::FakeClock;

TEST(TimestampReconstructor, StartsWithoutBase) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);

    EXPECT_EQ(ts.state().state, BaseState::NoBase);
    EXPECT_FALSE(ts.sample_time(0).has_value());
    EXPECT_FALSE(ts.base_point().has_value());
}

TEST(TimestampReconstructor, CoreFormula) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);
    ts.assign_base(12'000); // 120 ticks

    EXPECT_EQ(ts.sample_time(0), 988'000u);
    EXPECT_EQ(ts.sample_time(1'700), 989'700u); // T - 10.3 ms
    EXPECT_EQ(ts.state().state, BaseState::Based);
}

TEST(TimestampReconstructor, RebaseAccumulatesIntoBasePoint) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(5'000'000);
    ts.assign_base(4'000'000);
    ASSERT_EQ(ts.base_point(), 1'000'000u);

    ASSERT_TRUE(ts.rebase(1'500'000));
    EXPECT_EQ(ts.base_point(), 2'500'000u);
    EXPECT_EQ(ts.sample_time(1'000'000), 3'500'000u);
}

TEST(TimestampReconstructor, SuccessiveRebasesAdd) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(10'000'000);
    ts.assign_base(5'000'000);

    ASSERT_TRUE(ts.rebase(1'000'000));
    ASSERT_TRUE(ts.rebase(-250'000));
    EXPECT_EQ(ts.base_point(), 5'750'000u);
}

TEST(TimestampReconstructor, BaseAssignmentReplaces) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);
    ts.assign_base(500'000);
    ASSERT_TRUE(ts.rebase(100'000));

    ts.assign_base(200'000);
    EXPECT_EQ(ts.base_point(), 800'000u);
}

TEST(TimestampReconstructor, RebaseWithoutBaseIsRefused) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);

    EXPECT_FALSE(ts.rebase(1'000));
    EXPECT_EQ(ts.state().base_delta_us, 0);
}

TEST(TimestampReconstructor, BaseLastsOneBatch) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);
    ts.assign_base(12'000);
    ASSERT_TRUE(ts.sample_time(0).has_value());

    ts.begin_batch(2'000'000);
    EXPECT_FALSE(ts.sample_time(0).has_value());
    EXPECT_FALSE(ts.rebase(100));
    EXPECT_EQ(ts.state().state, BaseState::Based);
    EXPECT_EQ(ts.host_hint(), 2'000'000u);
}

TEST(TimestampReconstructor, NegativeBaseDeltaLiesAfterHint) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);
    ts.assign_base(-100);

    EXPECT_EQ(ts.sample_time(0), 1'000'100u);
}

TEST(TimestampReconstructor, WrapsWithHostCounter) {
    FakeClock clock(0, 1'000'000);
    TimestampReconstructor ts(clock);
    ts.begin_batch(5'000);
    ts.assign_base(12'000);

    const auto t = ts.sample_time(1'700);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, 994'700u);
    EXPECT_EQ(clock.diff(5'000, *t), 10'300);
}

TEST(TimestampReconstructor, ResetClearsBase) {
    FakeClock clock;
    TimestampReconstructor ts(clock);
    ts.begin_batch(1'000'000);
    ts.assign_base(12'000);

    ts.reset();

    EXPECT_EQ(ts.state().state, BaseState::NoBase);
    EXPECT_FALSE(ts.state().batch_valid);
    EXPECT_EQ(ts.state().base_delta_us, 0);
    EXPECT_FALSE(ts.sample_time(0).has_value());
}
