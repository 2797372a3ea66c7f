#include "epubkit/utils/Logger.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace epubkit {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = (std::filesystem::temp_directory_path() / "epubkit_logger_test.log").string();
        std::filesystem::remove(log_path_);
        Logger::getInstance().initialize(log_path_, Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
        std::filesystem::remove(log_path_);
    }

    std::string readLog() {
        Logger::getInstance().flush();
        std::ifstream in(log_path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string log_path_;
};

// 测试1: 模块宏带等级和模块前缀
TEST_F(LoggerTest, ModulePrefix) {
    EPUB_INFO("opened {} with {} items", "book.epub", 3);
    ARCHIVE_WARN("entry {} missing", "a.html");

    std::string content = readLog();
    EXPECT_NE(content.find("[INF][epub] opened book.epub with 3 items"), std::string::npos);
    EXPECT_NE(content.find("[WRN][arch] entry a.html missing"), std::string::npos);
    EXPECT_NE(content.find("Logger_test.cpp"), std::string::npos);
}

// 测试2: 低于当前等级的消息被过滤
TEST_F(LoggerTest, LevelFiltering) {
    Logger::getInstance().setLevel(Logger::Level::WARN);
    EPUBKIT_LOG_DEBUG("hidden debug line");
    EPUBKIT_LOG_ERROR("visible error line");

    std::string content = readLog();
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.find("visible error line"), std::string::npos);
}

// 测试3: 直接调用等级方法，TRACE 低于 DEBUG 被过滤
TEST_F(LoggerTest, DirectLevelMethods) {
    EXPECT_EQ(Logger::getInstance().getLevel(), Logger::Level::DEBUG);
    Logger::getInstance().trace("trace line");
    Logger::getInstance().warn("warn line");
    Logger::getInstance().critical("critical line");

    std::string content = readLog();
    EXPECT_EQ(content.find("trace line"), std::string::npos);
    EXPECT_NE(content.find("warn line"), std::string::npos);
    EXPECT_NE(content.find("critical line"), std::string::npos);

    Logger::getInstance().setLevel(Logger::Level::TRACE);
    EXPECT_EQ(Logger::getInstance().getLevel(), Logger::Level::TRACE);
    Logger::getInstance().trace("trace after lowering");
    EXPECT_NE(readLog().find("trace after lowering"), std::string::npos);
}

// 测试4: 格式串与参数不匹配时退化为原始格式串
TEST_F(LoggerTest, BadFormatFallsBack) {
    EPUBKIT_LOG_WARN("needs two {} {}", 1);
    EXPECT_NE(readLog().find("needs two {} {}"), std::string::npos);
}

// 测试5: shutdown之后可以重新初始化
TEST_F(LoggerTest, ReinitializeAfterShutdown) {
    Logger::getInstance().shutdown();
    EXPECT_FALSE(Logger::getInstance().isInitialized());

    Logger::getInstance().initialize(log_path_, Logger::Level::INFO, false);
    EXPECT_TRUE(Logger::getInstance().isInitialized());
    EPUBKIT_LOG_INFO("after restart");
    EXPECT_NE(readLog().find("after restart"), std::string::npos);
}

}  // namespace epubkit
