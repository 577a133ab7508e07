#include <gtest/gtest.h>
#include <strata/common/Logger.h>
#include <strata/backends/SpdlogBackend.h>
#include <strata/core/GraphData.h>
#include <strata/layout/SugiyamaLayout.h>

#include <memory>
#include <string>
#include <vector>

using namespace strata;

namespace {

struct Record {
    LogLevel level;
    std::string message;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<Record>& sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location&) override {
        sink_.push_back({level, message});
    }
    void setLevel(LogLevel level) override { lastLevel = level; }
    void flush() override {}

    LogLevel lastLevel = LogLevel::Info;

private:
    std::vector<Record>& sink_;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(std::make_unique<SpdlogBackend>());
    }
};

}  // namespace

TEST_F(LoggerTest, Capture_StoresFormattedMessageWithTag) {
    LOG_WARN("levels: {}", 3);

    auto logs = Logger::getCapturedLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[warn]"), std::string::npos);
    EXPECT_NE(logs[0].find("levels: 3"), std::string::npos);
}

TEST_F(LoggerTest, Capture_FiltersByPattern) {
    LOG_INFO("alpha");
    LOG_INFO("beta");
    LOG_DEBUG("alpha again");

    auto logs = Logger::getCapturedLogs("alpha");
    EXPECT_EQ(logs.size(), 2u);
}

TEST_F(LoggerTest, Capture_MaxLinesKeepsMostRecent) {
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto logs = Logger::getCapturedLogs("", 2);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_NE(logs[0].find("line 3"), std::string::npos);
    EXPECT_NE(logs[1].find("line 4"), std::string::npos);
}

TEST_F(LoggerTest, Capture_DisabledStoresNothing) {
    Logger::enableCapture(false);
    LOG_ERROR("not kept");

    EXPECT_FALSE(Logger::isCaptureEnabled());
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, Capture_PrefixesCallingFunction) {
    LOG_INFO("from test body");

    auto logs = Logger::getCapturedLogs("from test body");
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("() - "), std::string::npos);
}

TEST_F(LoggerTest, CustomBackend_ReceivesMessagesAndLevel) {
    std::vector<Record> records;
    auto backend = std::make_unique<RecordingBackend>(records);
    RecordingBackend* raw = backend.get();
    Logger::setBackend(std::move(backend));

    LOG_ERROR("disk {} missing", "A");
    Logger::setLevel(LogLevel::Debug);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Error);
    EXPECT_NE(records[0].message.find("disk A missing"), std::string::npos);
    EXPECT_EQ(raw->lastLevel, LogLevel::Debug);
}

TEST_F(LoggerTest, CustomBackend_ReceivesLayoutWarnings) {
    std::vector<Record> records;
    Logger::setBackend(std::make_unique<RecordingBackend>(records));

    GraphData graph;
    graph.addNode("a");
    graph.addNode("a");
    graph.addNode("b");
    graph.addEdge("e", "a", "b");
    graph.addEdge("e", "b", "a");
    SugiyamaLayout().layout(graph);

    std::vector<std::string> warnings;
    for (const Record& record : records) {
        if (record.level == LogLevel::Warn) {
            warnings.push_back(record.message);
        }
    }
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("Duplicate node id 'a'"), std::string::npos);
    EXPECT_NE(warnings[1].find("Duplicate edge id 'e'"), std::string::npos);
    EXPECT_NE(warnings[0].find("() - "), std::string::npos);
}
