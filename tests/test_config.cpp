#include <gtest/gtest.h>
#include "multiproof/config.hpp"
#include "multiproof/parallel.hpp"
#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace std;
using namespace multiproof;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("MULTIPROOF_THREADS");
        unsetenv("MULTIPROOF_DEBUG");
    }
};

TEST_F(ConfigTest, Defaults) {
    unsetenv("MULTIPROOF_THREADS");
    unsetenv("MULTIPROOF_DEBUG");
    Config config = Config::fromEnv();
    EXPECT_EQ(1u, config.threads);
    EXPECT_FALSE(config.debug);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("MULTIPROOF_THREADS", "6", 1);
    setenv("MULTIPROOF_DEBUG", "1", 1);
    Config config = Config::fromEnv();
    EXPECT_EQ(6u, config.threads);
    EXPECT_TRUE(config.debug);
}

TEST_F(ConfigTest, ZeroThreadsMeansAllCores) {
    setenv("MULTIPROOF_THREADS", "0", 1);
    EXPECT_GE(Config::fromEnv().threads, 1u);
}

TEST_F(ConfigTest, IgnoresMalformedValues) {
    setenv("MULTIPROOF_THREADS", "four", 1);
    setenv("MULTIPROOF_DEBUG", "yes", 1);
    Config config = Config::fromEnv();
    EXPECT_EQ(1u, config.threads);
    EXPECT_FALSE(config.debug);

    setenv("MULTIPROOF_THREADS", "-2", 1);
    EXPECT_EQ(1u, Config::fromEnv().threads);
}

TEST(ForkJoinTest, VisitsEveryIndexOnce) {
    for (size_t threads : {1u, 3u, 8u}) {
        vector<int> hits(17, 0);
        forkJoin(hits.size(), threads, [&](size_t i) { hits[i]++; });
        EXPECT_EQ(vector<int>(17, 1), hits) << threads;
    }
}

TEST(ForkJoinTest, MoreThreadsThanWork) {
    atomic<size_t> calls(0);
    forkJoin(2, 16, [&](size_t) { calls++; });
    EXPECT_EQ(2u, calls.load());

    forkJoin(0, 4, [&](size_t) { calls++; });
    EXPECT_EQ(2u, calls.load());
}

TEST(ForkJoinTest, PropagatesWorkerExceptions) {
    EXPECT_THROW(forkJoin(10, 4, [](size_t i) {
        if (i == 7) throw runtime_error("worker failed");
    }), runtime_error);
}

TEST(ForkJoinTest, RethrowsLowestFailingIndex) {
    vector<int> done(12, 0);
    try {
        forkJoin(done.size(), 4, [&](size_t i) {
            done[i] = 1;
            if (i == 3 || i == 9) throw runtime_error("index " + to_string(i));
        });
        ADD_FAILURE() << "expected a worker failure";
    } catch (const runtime_error &e) {
        EXPECT_STREQ("index 3", e.what());
    }
    // the loop still runs every index
    EXPECT_EQ(vector<int>(12, 1), done);
}
