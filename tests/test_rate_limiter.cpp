#include <gtest/gtest.h>

#include "rate_limiter.hpp"
#include "session.hpp"

using namespace toolmesh;

TEST(FrameRateLimiterTest, ZeroMeansUnlimited) {
    FrameRateLimiter limiter(0);
    EXPECT_TRUE(limiter.unlimited());
    for (int i = 0; i < 10000; i++) {
        ASSERT_TRUE(limiter.Admit());
    }
    EXPECT_EQ(limiter.frames_processed(), 10000);
}

TEST(FrameRateLimiterTest, AdmitsExactlyMaxFrames) {
    FrameRateLimiter limiter(3);
    EXPECT_TRUE(limiter.Admit());
    EXPECT_TRUE(limiter.Admit());
    EXPECT_TRUE(limiter.Admit());
    EXPECT_FALSE(limiter.Admit());
    EXPECT_EQ(limiter.frames_processed(), 4);
}

TEST(FrameRateLimiterTest, StaysClosedAfterLimit) {
    FrameRateLimiter limiter(1);
    EXPECT_TRUE(limiter.Admit());
    for (int i = 0; i < 5; i++) {
        EXPECT_FALSE(limiter.Admit());
    }
}

TEST(FrameRateLimiterTest, SessionsCountIndependently) {
    Session a("a", 2);
    Session b("b", 2);
    EXPECT_TRUE(a.limiter().Admit());
    EXPECT_TRUE(a.limiter().Admit());
    EXPECT_FALSE(a.limiter().Admit());

    EXPECT_TRUE(b.limiter().Admit());
    EXPECT_EQ(b.frames_processed(), 1);
    EXPECT_EQ(a.frames_processed(), 3);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
