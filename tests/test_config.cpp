#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "gtest/gtest.h"
#include "respool/config.hpp"
#include "respool/log.hpp"
#include "respool/pool/pool.hpp"
#include "respool/resource.hpp"

using namespace respool;
using namespace std::chrono_literals;

TEST(ConfigTest, DefaultsNeedOnlyMaxSize) {
    PoolConfiguration cfg;
    EXPECT_EQ(cfg.name, "pool");
    EXPECT_FALSE(cfg.acquire_timeout_default.has_value());
    EXPECT_FALSE(cfg.validate_on_release.has_value());
    EXPECT_EQ(cfg.idle_target, 0u);
    EXPECT_EQ(cfg.idle_ttl, 0ms);
    EXPECT_EQ(cfg.violation_policy, default_violation_policy);

    EXPECT_THROW(validate_configuration(cfg), std::invalid_argument);
    cfg.max_size = 4;
    EXPECT_NO_THROW(validate_configuration(cfg));
}

TEST(ConfigTest, RejectsIdleTargetAboveCapacity) {
    PoolConfiguration cfg;
    cfg.max_size = 2;
    cfg.idle_target = 3;
    EXPECT_THROW(validate_configuration(cfg), std::invalid_argument);
    cfg.idle_target = 2;
    EXPECT_NO_THROW(validate_configuration(cfg));
}

TEST(ConfigTest, RejectsNegativeDurations) {
    PoolConfiguration cfg;
    cfg.max_size = 1;
    cfg.acquire_timeout_default = -1ms;
    EXPECT_THROW(validate_configuration(cfg), std::invalid_argument);

    cfg.acquire_timeout_default = 0ms;
    EXPECT_NO_THROW(validate_configuration(cfg));

    cfg.idle_ttl = -5ms;
    EXPECT_THROW(validate_configuration(cfg), std::invalid_argument);
}

TEST(ConfigTest, ViolationPolicyNames) {
    EXPECT_EQ(parse_violation_policy("strict"), ViolationPolicy::Strict);
    EXPECT_EQ(parse_violation_policy("LENIENT"), ViolationPolicy::Lenient);
    EXPECT_FALSE(parse_violation_policy("sometimes").has_value());
    EXPECT_STREQ(to_string(ViolationPolicy::Strict), "strict");
    EXPECT_STREQ(to_string(ViolationPolicy::Lenient), "lenient");
}

TEST(LogTest, DefaultLoggerIsSharedAndRegistered) {
    auto a = default_logger();
    auto b = default_logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(spdlog::get(default_logger_name), a);
}

TEST(LogTest, PoolLogsThroughConfiguredLogger) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("config-test", sink);
    logger->set_pattern("%l %v");

    PoolConfiguration cfg;
    cfg.name = "logged";
    cfg.max_size = 1;
    cfg.violation_policy = ViolationPolicy::Lenient;
    cfg.logger = logger;

    auto factory = make_factory<int>([] { return std::make_unique<int>(0); },
                                     [](int& v) { v = 0; });
    {
        Pool<int> pool(factory, cfg);
        auto lease = pool.acquire(std::nullopt).value();
        ASSERT_TRUE(pool.release(std::move(lease)));
        EXPECT_FALSE(pool.release(std::move(lease)));
    }
    logger->flush();

    const auto text = out.str();
    EXPECT_NE(text.find("info pool 'logged' created (max_size=1"),
              std::string::npos);
    EXPECT_NE(text.find("error pool 'logged': release of an empty"),
              std::string::npos);
    EXPECT_NE(text.find("info pool 'logged' shut down"), std::string::npos);
}
