#include <gtest/gtest.h>
#include "jwtkit/jwtkit.hpp"
#include "fixtures.hpp"
#include <string>
#include <utility>
#include <vector>

using jwtkit::LogLevel;

namespace {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        jwtkit::setLogSink([this](LogLevel level, std::string_view message) {
            records.emplace_back(level, std::string(message));
        });
    }

    void TearDown() override {
        jwtkit::setLogSink({});
        jwtkit::setLogLevel(LogLevel::Warning);
    }

    bool logged(LogLevel level, const std::string& fragment) const {
        for (const auto& [recordLevel, message] : records) {
            if (recordLevel == level && message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<LogLevel, std::string>> records;
};

}

TEST_F(LogTest, DefaultLevelIsWarning) {
    EXPECT_EQ(jwtkit::logLevel(), LogLevel::Warning);
    EXPECT_FALSE(jwtkit::log::enabled(LogLevel::Debug));
    EXPECT_FALSE(jwtkit::log::enabled(LogLevel::Info));
    EXPECT_TRUE(jwtkit::log::enabled(LogLevel::Warning));
    EXPECT_TRUE(jwtkit::log::enabled(LogLevel::Error));
}

TEST_F(LogTest, FormatsArguments) {
    jwtkit::log::warning("key {} rejected after {} attempts", "abc", 3);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].first, LogLevel::Warning);
    EXPECT_EQ(records[0].second, "key abc rejected after 3 attempts");
}

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
    jwtkit::log::debug("hidden {}", 1);
    jwtkit::log::info("hidden {}", 2);
    EXPECT_TRUE(records.empty());

    jwtkit::setLogLevel(LogLevel::Debug);
    jwtkit::log::debug("shown {}", 3);
    EXPECT_TRUE(logged(LogLevel::Debug, "shown 3"));
}

TEST_F(LogTest, OffSilencesEverything) {
    jwtkit::setLogLevel(LogLevel::Off);
    jwtkit::log::error("nobody hears this");
    EXPECT_TRUE(records.empty());
}

TEST_F(LogTest, FailedVerificationIsLogged) {
    auto key = jwtkit::Jwk::parse(fixtures::RS256_PUBLIC_KEY);
    EXPECT_THROW((void)jwtkit::verify(fixtures::RAW_PKCS1_TOKEN, key), jwtkit::Error);
    EXPECT_TRUE(logged(LogLevel::Warning, "Signature does not match key"));
}

TEST_F(LogTest, DebugTraceOfTokenDecoding) {
    jwtkit::setLogLevel(LogLevel::Debug);
    (void)jwtkit::decode(fixtures::HS256_TOKEN);
    EXPECT_FALSE(records.empty());
    for (const auto& record : records) {
        EXPECT_EQ(record.first, LogLevel::Debug);
    }
}

TEST_F(LogTest, SinkMayLogItself) {
    int depth = 0;
    jwtkit::setLogSink([&](LogLevel level, std::string_view message) {
        records.emplace_back(level, std::string(message));
        if (depth++ == 0) {
            jwtkit::log::warning("nested after '{}'", message);
        }
    });

    jwtkit::log::error("outer");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].second, "outer");
    EXPECT_EQ(records[1].second, "nested after 'outer'");
}

TEST_F(LogTest, SinkMayReplaceItself) {
    jwtkit::setLogSink([this](LogLevel level, std::string_view message) {
        records.emplace_back(level, std::string(message));
        jwtkit::setLogSink([this](LogLevel, std::string_view) {
            records.emplace_back(LogLevel::Off, "replacement");
        });
    });

    jwtkit::log::warning("first");
    jwtkit::log::warning("second");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].second, "first");
    EXPECT_EQ(records[1].second, "replacement");
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(jwtkit::toString(LogLevel::Debug), "debug");
    EXPECT_EQ(jwtkit::toString(LogLevel::Warning), "warning");
    EXPECT_EQ(jwtkit::toString(LogLevel::Off), "off");
}
