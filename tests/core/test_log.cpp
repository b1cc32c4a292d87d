#include <gtest/gtest.h>
#include "umb/log.hpp"
#include "test_support.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace umb;
using umb::testing_support::LogCapture;

// ─── Level names ─────────────────────────────────────────────────────────────

TEST(Log_Level, ParsesCaseInsensitively) {
    EXPECT_EQ(log::level_from_string("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::level_from_string("Info"), log::Level::Info);
    EXPECT_EQ(log::level_from_string("warning"), log::Level::Warn);
    EXPECT_EQ(log::level_from_string("off"), log::Level::Off);
    EXPECT_FALSE(log::level_from_string("loud").has_value());
}

TEST(Log_Level, NamesAreUppercase) {
    EXPECT_EQ(log::to_string(log::Level::Warn), "WARN");
    EXPECT_EQ(log::to_string(log::Level::Error), "ERROR");
}

// ─── Threshold ───────────────────────────────────────────────────────────────

TEST(Log_Threshold, BelowThresholdIsDropped) {
    LogCapture capture(log::Level::Warn);
    log::info("test", "hidden {}", 1);
    log::warn("test", "shown {}", 2);
    log::error("test", "shown {}", 3);
    EXPECT_EQ(capture.count(log::Level::Info), 0u);
    EXPECT_EQ(capture.count(log::Level::Warn), 1u);
    EXPECT_EQ(capture.count(log::Level::Error), 1u);
    EXPECT_TRUE(capture.contains("shown 2"));
}

TEST(Log_Threshold, OffSilencesEverything) {
    LogCapture capture(log::Level::Off);
    log::error("test", "nothing");
    EXPECT_EQ(capture.count(log::Level::Error), 0u);
    EXPECT_FALSE(log::enabled(log::Level::Off));
}

TEST(Log_Threshold, CaptureRestoresPreviousLevel) {
    log::set_level(log::Level::Info);
    {
        LogCapture capture(log::Level::Trace);
        EXPECT_EQ(log::level(), log::Level::Trace);
    }
    EXPECT_EQ(log::level(), log::Level::Info);
}

// ─── Sink ────────────────────────────────────────────────────────────────────

TEST(Log_Sink, ReceivesComponent) {
    std::vector<std::string> components;
    log::set_level(log::Level::Trace);
    log::set_sink([&](log::Level, std::string_view component, std::string_view) {
        components.emplace_back(component);
    });
    log::debug("cache", "x");
    log::trace("store", "y");
    log::reset_sink();
    log::set_level(log::Level::Info);
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], "cache");
    EXPECT_EQ(components[1], "store");
}

TEST(Log_Sink, ConcurrentWritersAllDelivered) {
    LogCapture capture(log::Level::Info);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                log::info("worker", "thread {} line {}", t, i);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(capture.count(log::Level::Info), 200u);
}
