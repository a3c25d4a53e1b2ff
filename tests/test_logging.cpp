#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include "../src/core/Console.h"
#include <sstream>
#include <thread>
#include <vector>

namespace sb_modsign {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        Logger::instance().set_stream(&captured);
    }

    void TearDown() override {
        Logger::instance().set_stream(nullptr);
        Logger::instance().set_level(LogLevel::Info);
    }

    std::ostringstream captured;
};

TEST_F(LoggingTest, SingletonInstance) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST_F(LoggingTest, FiltersBelowLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    logger.error("boom");
    logger.warn("careful");
    logger.info("chatter");
    logger.debug("noise");
    std::string out = captured.str();
    EXPECT_NE(out.find("[error] boom"), std::string::npos);
    EXPECT_NE(out.find("[warn] careful"), std::string::npos);
    EXPECT_EQ(out.find("chatter"), std::string::npos);
    EXPECT_EQ(out.find("noise"), std::string::npos);
}

TEST_F(LoggingTest, TraceEnablesEverything) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);
    logger.trace("deep");
    logger.debug("less deep");
    EXPECT_NE(captured.str().find("[trace] deep"), std::string::npos);
    EXPECT_NE(captured.str().find("[debug] less deep"), std::string::npos);
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    const int num_threads = 8;
    const int logs_per_thread = 50;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                logger.info("Thread " + std::to_string(i) + " log " + std::to_string(j));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    std::istringstream lines(captured.str());
    std::string line; int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("[info] Thread ", 0), 0u) << line;
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}

TEST_F(LoggingTest, LevelChangesWhileLogging) {
    Logger& logger = Logger::instance();
    const int rounds = 200;
    std::thread writer([&]() {
        for (int j = 0; j < rounds; ++j) logger.debug("detail " + std::to_string(j));
    });
    std::thread switcher([&]() {
        for (int j = 0; j < rounds; ++j) logger.set_level(j % 2 ? LogLevel::Debug : LogLevel::Error);
    });
    writer.join();
    switcher.join();

    std::istringstream lines(captured.str());
    std::string line;
    while (std::getline(lines, line)) EXPECT_EQ(line.rfind("[debug] detail ", 0), 0u) << line;
    logger.set_level(LogLevel::Error);
    logger.debug("hidden");
    EXPECT_EQ(captured.str().find("hidden"), std::string::npos);
}

TEST(ConsoleTest, PlainPrefixes) {
    std::ostringstream os;
    Console console(os, false);
    console.status("a");
    console.success("b");
    console.warning("c");
    console.error("d");
    EXPECT_EQ(os.str(), "[INFO] a\n[SUCCESS] b\n[WARNING] c\n[ERROR] d\n");
}

TEST(ConsoleTest, ColoredPrefixes) {
    std::ostringstream os;
    Console console(os, true);
    console.error("bad");
    EXPECT_EQ(os.str(), "\033[0;31m[ERROR]\033[0m bad\n");
}

}
