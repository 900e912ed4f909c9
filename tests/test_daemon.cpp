#include <gtest/gtest.h>
#include "daemon/daemon.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

using namespace marquise;
using namespace marquise::test;

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() /
                  ("marquise_daemon_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);

        config.origin = "ORIGIN1";
        config.cache_file = (testDir / "default.cache").string();
        config.loop.idle_interval_sec = 0.001;
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    static std::vector<uint8_t> pointsBatch() {
        std::vector<uint8_t> buf;
        append_point(buf, 0x10, 1, 1);
        append_point(buf, 0x12, 2, 2);
        return buf;
    }

    static std::vector<uint8_t> contentsBatch() {
        std::vector<uint8_t> buf;
        append_contents(buf, 0x10, "host:a");
        append_contents(buf, 0x20, "host:a");
        append_contents(buf, 0x30, "host:b");
        return buf;
    }

    std::filesystem::path testDir;
    DaemonConfig config;
};

// Shutdown requested before start: each loop handles exactly one batch
TEST_F(DaemonTest, ProcessesBatchAndPersistsCache) {
    FakeSpoolState pointsState, contentsState;
    FakeBrokerState pointsBroker, contentsBroker;
    pointsState.ready.push_back(pointsBatch());
    contentsState.ready.push_back(contentsBatch());

    FakeSpool ps(pointsState), cs(contentsState);
    FakeBroker pb(pointsBroker), cb(contentsBroker);
    ShutdownSignal shutdown;
    shutdown.request();

    Daemon daemon(config, shutdown, ps, cs, pb, cb);
    daemon.start();
    EXPECT_EQ(daemon.wait(), DaemonStatus::OK);
    EXPECT_EQ(daemon.loops_running(), 0);

    EXPECT_EQ(pointsState.sealed.size(), 1u);
    EXPECT_EQ(contentsState.sealed.size(), 1u);
    EXPECT_EQ(pointsBroker.bursts.size(), 1u);
    EXPECT_EQ(contentsBroker.updates.size(), 2u);

    SourceCache saved("ORIGIN1");
    ASSERT_EQ(SourceCache::load_file(config.cache_file.c_str(), "ORIGIN1", saved),
              CacheLoadStatus::OK);
    EXPECT_EQ(saved.size(), 2u);

    // wait() is idempotent
    EXPECT_EQ(daemon.wait(), DaemonStatus::OK);
}

TEST_F(DaemonTest, RestartedDaemonRemembersForwardedDicts) {
    for (int run = 0; run < 2; ++run) {
        FakeSpoolState pointsState, contentsState;
        FakeBrokerState pointsBroker, contentsBroker;
        contentsState.ready.push_back(contentsBatch());

        FakeSpool ps(pointsState), cs(contentsState);
        FakeBroker pb(pointsBroker), cb(contentsBroker);
        ShutdownSignal shutdown;
        shutdown.request();

        Daemon daemon(config, shutdown, ps, cs, pb, cb);
        daemon.start();
        ASSERT_EQ(daemon.wait(), DaemonStatus::OK);

        EXPECT_EQ(contentsState.sealed.size(), 1u);
        EXPECT_EQ(contentsBroker.updates.size(), run == 0 ? 2u : 0u);
    }
}

TEST_F(DaemonTest, RejectedOriginStopsBothLoops) {
    FakeSpoolState pointsState, contentsState;
    FakeBrokerState pointsBroker, contentsBroker;
    pointsState.ready.push_back(pointsBatch());
    pointsBroker.fail_at = 0;
    pointsBroker.fail_with = AckStatus::REJECTED_ORIGIN;

    FakeSpool ps(pointsState), cs(contentsState);
    FakeBroker pb(pointsBroker), cb(contentsBroker);
    ShutdownSignal shutdown;   // never requested from outside

    Daemon daemon(config, shutdown, ps, cs, pb, cb);
    daemon.start();
    EXPECT_EQ(daemon.wait(), DaemonStatus::REJECTED_ORIGIN);
    EXPECT_FALSE(shutdown.requested());
    EXPECT_TRUE(pointsState.sealed.empty());

    // The cache is still written on the way out
    EXPECT_TRUE(std::filesystem::exists(config.cache_file));
}

TEST_F(DaemonTest, FormatErrorStopsOnlyThatLoop) {
    FakeSpoolState pointsState, contentsState;
    FakeBrokerState pointsBroker, contentsBroker;
    pointsState.ready.push_back(std::vector<uint8_t>(5, 0));

    FakeSpool ps(pointsState), cs(contentsState);
    FakeBroker pb(pointsBroker), cb(contentsBroker);
    ShutdownSignal shutdown;

    Daemon daemon(config, shutdown, ps, cs, pb, cb);
    daemon.start();

    // The contents loop keeps polling until it is told to stop
    while (daemon.loops_running() > 1) {
        sleep_sec(0.001);
    }
    EXPECT_EQ(daemon.loops_running(), 1);

    shutdown.request();
    EXPECT_EQ(daemon.wait(), DaemonStatus::LOOP_FAILED);
    EXPECT_EQ(daemon.loops_running(), 0);
}

TEST_F(DaemonTest, UnwritableCacheIsReported) {
    config.cache_file = (testDir / "missing" / "default.cache").string();

    FakeSpoolState pointsState, contentsState;
    FakeBrokerState pointsBroker, contentsBroker;
    FakeSpool ps(pointsState), cs(contentsState);
    FakeBroker pb(pointsBroker), cb(contentsBroker);
    ShutdownSignal shutdown;
    shutdown.request();

    Daemon daemon(config, shutdown, ps, cs, pb, cb);
    daemon.start();
    EXPECT_EQ(daemon.wait(), DaemonStatus::CACHE_NOT_SAVED);
}

TEST_F(DaemonTest, InvalidOriginRunsNothing) {
    const std::string bad[] = { std::string(MAX_ORIGIN_LEN + 1, 'A'), "", "ORI GIN" };
    for (const std::string& origin : bad) {
        config.origin = origin;

        FakeSpoolState pointsState, contentsState;
        FakeBrokerState pointsBroker, contentsBroker;
        pointsState.ready.push_back(pointsBatch());
        contentsState.ready.push_back(contentsBatch());

        FakeSpool ps(pointsState), cs(contentsState);
        FakeBroker pb(pointsBroker), cb(contentsBroker);
        ShutdownSignal shutdown;

        Daemon daemon(config, shutdown, ps, cs, pb, cb);
        daemon.start();
        EXPECT_EQ(daemon.loops_running(), 0);
        EXPECT_EQ(daemon.wait(), DaemonStatus::INVALID_ORIGIN);

        EXPECT_EQ(pointsState.fetches, 0);
        EXPECT_EQ(contentsState.fetches, 0);
        EXPECT_TRUE(pointsBroker.bursts.empty());
        EXPECT_FALSE(std::filesystem::exists(config.cache_file));
    }
}

TEST(DaemonStatusTest, Names) {
    EXPECT_STREQ(daemon_status_name(DaemonStatus::OK), "ok");
    EXPECT_STREQ(daemon_status_name(DaemonStatus::REJECTED_ORIGIN), "origin rejected by broker");
    EXPECT_STREQ(daemon_status_name(DaemonStatus::INVALID_ORIGIN), "invalid origin");
}
