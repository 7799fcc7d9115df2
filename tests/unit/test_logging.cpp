#include <gtest/gtest.h>
#include "rpcwire/logging.hpp"

using namespace rpcwire;

TEST(LogManager, ComponentLoggers) {
    auto def = LogManager::get_logger();
    auto net = LogManager::get_logger("transport");
    ASSERT_NE(def, nullptr);
    ASSERT_NE(net, nullptr);
    EXPECT_EQ(def->name(), "rpcwire");
    EXPECT_EQ(net->name(), "transport");
}

TEST(LogManager, UnknownComponentFallsBackToDefault) {
    EXPECT_EQ(LogManager::get_logger("nope"), LogManager::get_logger());
}

TEST(LogManager, SetLevelAppliesToAllComponents) {
    LogManager::set_level("debug");
    EXPECT_EQ(LogManager::get_logger()->level(), spdlog::level::debug);
    EXPECT_EQ(LogManager::get_logger("transport")->level(), spdlog::level::debug);
    LogManager::set_level("warn");
    EXPECT_EQ(LogManager::get_logger("transport")->level(), spdlog::level::warn);
}

TEST(LogManager, ShutdownThenReinitialize) {
    LogManager::shutdown();
    LogManager::initialize("error");
    EXPECT_EQ(LogManager::get_logger()->level(), spdlog::level::err);
    // A second initialize is ignored
    LogManager::initialize("trace");
    EXPECT_EQ(LogManager::get_logger()->level(), spdlog::level::err);
    RPCWIRE_LOG_DEBUG("not shown {}", 1);
    LogManager::set_level("warn");
}
