// =============================================================================
// Unit tests for the logger (src/castlink_log.hpp)
// Tests: level parsing, filtering, line format, sink, log file
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "castlink_log.hpp"

using namespace castlink;

namespace {

// Captures records through the sink and restores the global logger afterwards
class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = log::logLevel();
        log::setStderrEnabled(false);
        log::setSink([this](const log::Record& r) { records_.push_back(r); });
    }
    void TearDown() override {
        log::setSink(nullptr);
        log::closeLogFile();
        log::setStderrEnabled(true);
        log::setLogLevel(saved_level_);
    }

    log::Level saved_level_ = log::Level::Info;
    std::vector<log::Record> records_;
};

} // namespace

// ---------------------------------------------------------------------------
// L-1: level names
// ---------------------------------------------------------------------------
TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(log::parseLevel("trace"), log::Level::Trace);
    EXPECT_EQ(log::parseLevel("debug"), log::Level::Debug);
    EXPECT_EQ(log::parseLevel("warn"), log::Level::Warn);
    EXPECT_EQ(log::parseLevel("warning"), log::Level::Warn);
    EXPECT_EQ(log::parseLevel("error"), log::Level::Error);
    EXPECT_EQ(log::parseLevel("fatal"), log::Level::Fatal);
    EXPECT_EQ(log::parseLevel("info"), log::Level::Info);
    EXPECT_EQ(log::parseLevel("verbose"), log::Level::Info);
}

// ---------------------------------------------------------------------------
// L-2: records below the minimum level are not emitted
// ---------------------------------------------------------------------------
TEST_F(LogTest, LevelFilter) {
    log::setLogLevel(log::Level::Warn);
    CLOG_DEBUG("session", "hidden %d", 1);
    CLOG_INFO("session", "hidden %d", 2);
    CLOG_WARN("session", "shown %d", 3);
    CLOG_ERROR("session", "shown %d", 4);

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].level, log::Level::Warn);
    EXPECT_EQ(records_[0].message, "shown 3");
    EXPECT_EQ(records_[1].level, log::Level::Error);
}

// ---------------------------------------------------------------------------
// L-3: line layout "HH:MM:SS.mmm [LEVEL] [tag] (Ttid) message"
// ---------------------------------------------------------------------------
TEST_F(LogTest, LineCarriesLevelTagAndThread) {
    log::setLogLevel(log::Level::Trace);
    CLOG_INFO("bitrate", "target %u bps", 15000000u);

    ASSERT_EQ(records_.size(), 1u);
    const auto& r = records_[0];
    EXPECT_EQ(r.tag, "bitrate");
    EXPECT_EQ(r.message, "target 15000000 bps");
    EXPECT_EQ(r.thread, log::currentThreadTag());
    EXPECT_NE(r.line.find("[INFO ] [bitrate]"), std::string::npos);
    EXPECT_NE(r.line.find("(T" + std::to_string(r.thread) + ")"), std::string::npos);
    EXPECT_EQ(r.line.substr(r.line.size() - r.message.size()), r.message);
    ASSERT_GE(r.line.size(), 12u);
    EXPECT_EQ(r.line[2], ':');
    EXPECT_EQ(r.line[8], '.');
}

TEST_F(LogTest, LongMessageTruncated) {
    log::setLogLevel(log::Level::Trace);
    std::string big(log::MAX_MESSAGE * 2, 'x');
    CLOG_INFO("t", "%s", big.c_str());

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message.size(), log::MAX_MESSAGE - 1);
}

// ---------------------------------------------------------------------------
// L-4: log file receives the same lines
// ---------------------------------------------------------------------------
TEST_F(LogTest, LogFileGetsLines) {
    const char* path = "__test_castlink_log.txt";
    log::setLogLevel(log::Level::Info);
    ASSERT_TRUE(log::openLogFile(path));
    CLOG_WARN("keystore", "first");
    CLOG_ERROR("keystore", "second");
    log::closeLogFile();

    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(lines[0], records_[0].line);
    EXPECT_EQ(lines[1], records_[1].line);
    in.close();
    std::remove(path);
}

TEST_F(LogTest, ClearedSinkStopsDelivery) {
    log::setLogLevel(log::Level::Info);
    CLOG_INFO("t", "one");
    log::setSink(nullptr);
    CLOG_INFO("t", "two");
    EXPECT_EQ(records_.size(), 1u);
}
