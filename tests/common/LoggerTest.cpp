#include "backends/DefaultBackend.h"
#include "common/CapturingLoggerBackend.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

namespace RTE {

using namespace Test;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lines_ = std::make_shared<CapturingLoggerBackend::Storage>();
        Logger::setBackend(std::make_unique<CapturingLoggerBackend>(lines_));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<CapturingLoggerBackend::Storage> lines_;
};

TEST_F(LoggerTest, MacrosFormatAndPrefixCallingFunction) {
    LOG_INFO("replayed {} of {} records", 3, 5);

    ASSERT_EQ(1u, lines_->size());
    EXPECT_EQ(LogLevel::Info, lines_->front().level);
    EXPECT_NE(lines_->front().message.find("() - replayed 3 of 5 records"), std::string::npos);
}

TEST_F(LoggerTest, EachMacroUsesItsLevel) {
    LOG_TRACE("t");
    LOG_DEBUG("d");
    LOG_INFO("i");
    LOG_WARN("w");
    LOG_ERROR("e");

    ASSERT_EQ(5u, lines_->size());
    EXPECT_EQ(LogLevel::Trace, (*lines_)[0].level);
    EXPECT_EQ(LogLevel::Debug, (*lines_)[1].level);
    EXPECT_EQ(LogLevel::Info, (*lines_)[2].level);
    EXPECT_EQ(LogLevel::Warn, (*lines_)[3].level);
    EXPECT_EQ(LogLevel::Error, (*lines_)[4].level);
}

TEST_F(LoggerTest, SetLevelReachesInjectedBackend) {
    Logger::setLevel(LogLevel::Warn);

    LOG_INFO("dropped");
    LOG_WARN("kept");

    ASSERT_EQ(1u, lines_->size());
    EXPECT_TRUE(containsLine(*lines_, LogLevel::Warn, "kept"));
}

class MockLoggerBackend : public ILoggerBackend {
public:
    MOCK_METHOD(void, log, (LogLevel level, const std::string &message, const std::source_location &loc), (override));
    MOCK_METHOD(void, setLevel, (LogLevel level), (override));
    MOCK_METHOD(void, flush, (), (override));
};

TEST(LoggerBackendInjectionTest, FacadeForwardsToInjectedBackend) {
    auto backend = std::make_unique<::testing::StrictMock<MockLoggerBackend>>();
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*backend, setLevel(LogLevel::Debug));
        EXPECT_CALL(*backend, log(LogLevel::Warn, ::testing::HasSubstr("journal is empty"), ::testing::_));
        EXPECT_CALL(*backend, flush());
    }

    Logger::setBackend(std::move(backend));
    Logger::setLevel(LogLevel::Debug);
    LOG_WARN("journal is empty");
    Logger::flush();
    Logger::setBackend(nullptr);
}

TEST(LogLevelTest, ParsesSpdlogNames) {
    EXPECT_EQ(LogLevel::Trace, parseLogLevel("trace", LogLevel::Info));
    EXPECT_EQ(LogLevel::Debug, parseLogLevel("DEBUG", LogLevel::Info));
    EXPECT_EQ(LogLevel::Warn, parseLogLevel("warning", LogLevel::Info));
    EXPECT_EQ(LogLevel::Error, parseLogLevel("err", LogLevel::Info));
    EXPECT_EQ(LogLevel::Critical, parseLogLevel("critical", LogLevel::Info));
    EXPECT_EQ(LogLevel::Off, parseLogLevel("Off", LogLevel::Info));
    EXPECT_EQ(LogLevel::Error, parseLogLevel("verbose", LogLevel::Error));
}

TEST(DefaultBackendTest, WritesLevelAndMessageAboveThreshold) {
    std::ostringstream out;
    DefaultBackend backend(out);
    backend.setLevel(LogLevel::Info);

    backend.log(LogLevel::Debug, "hidden", std::source_location::current());
    backend.log(LogLevel::Warn, "visible", std::source_location::current());
    backend.flush();

    const std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("warn"), std::string::npos);
    EXPECT_NE(text.find("] visible\n"), std::string::npos);
}

TEST(DefaultBackendTest, OffSilencesEverything) {
    std::ostringstream out;
    DefaultBackend backend(out);
    backend.setLevel(LogLevel::Off);

    backend.log(LogLevel::Error, "nothing", std::source_location::current());

    EXPECT_TRUE(out.str().empty());
}

TEST(LogSanitizeTest, EscapesLineBreaksAndReplacesControlBytes) {
    EXPECT_EQ("tag\\nINFO forged", Log::sanitize("tag\nINFO forged"));
    EXPECT_EQ("a\\rb", Log::sanitize("a\rb"));
    EXPECT_EQ("x?y", Log::sanitize(std::string("x\x01y")));
}

TEST(LogSanitizeTest, TruncatesLongInput) {
    EXPECT_EQ("abc...", Log::sanitize("abcdef", 3));
    EXPECT_EQ("abc", Log::sanitize("abc", 3));
}

}  // namespace RTE
