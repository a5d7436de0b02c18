#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace rcp::test;
namespace logging = rcp::log;

TEST(LogTest, LevelNamesRoundTrip) {
    for (auto level : {logging::Level::Trace, logging::Level::Debug, logging::Level::Info, logging::Level::Warn,
                       logging::Level::Error, logging::Level::Critical, logging::Level::Off}) {
        auto parsed = logging::parse_level(logging::level_name(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
    EXPECT_EQ(logging::parse_level("WARNING"), logging::Level::Warn);
    EXPECT_FALSE(logging::parse_level("verbose").has_value());
}

TEST(LogTest, GlobalLevelAppliesToModulesWithoutOwnLevel) {
    auto saved = logging::get_level();

    logging::set_level(logging::Level::Error);
    EXPECT_EQ(logging::get_level(), logging::Level::Error);
    auto& logger = logging::Logger::get("logtest_global");
    EXPECT_FALSE(logger.should_log(logging::Level::Warn));
    EXPECT_TRUE(logger.should_log(logging::Level::Error));

    logging::set_level(saved);
    EXPECT_EQ(logger.should_log(logging::Level::Info), saved <= logging::Level::Info);
}

TEST(LogTest, ModuleLevelCoversDottedChildren) {
    auto& parent = logging::Logger::get("logtest_parent");
    auto& child = logging::Logger::get("logtest_parent.child");
    auto& grandchild = logging::Logger::get("logtest_parent.child.leaf");
    auto& sibling = logging::Logger::get("logtest_parentx");

    logging::set_module_level("logtest_parent", logging::Level::Trace);
    EXPECT_TRUE(parent.should_log(logging::Level::Trace));
    EXPECT_TRUE(child.should_log(logging::Level::Trace));
    EXPECT_TRUE(grandchild.should_log(logging::Level::Trace));
    EXPECT_FALSE(sibling.should_log(logging::Level::Trace));

    // The nearest explicit level wins
    logging::set_module_level("logtest_parent.child", logging::Level::Error);
    EXPECT_TRUE(parent.should_log(logging::Level::Trace));
    EXPECT_FALSE(child.should_log(logging::Level::Warn));
    EXPECT_FALSE(grandchild.should_log(logging::Level::Warn));

    // Loggers created later pick up the configured level
    auto& late = logging::Logger::get("logtest_parent.late");
    EXPECT_TRUE(late.should_log(logging::Level::Trace));
    EXPECT_EQ(late.module(), "logtest_parent.late");
}

TEST(LogTest, CaptureSeesOnlyEnabledLevels) {
    LogCapture capture;
    auto& logger = logging::Logger::get("logtest_capture");
    logging::set_module_level("logtest_capture", logging::Level::Warn);

    logger.info("quiet line");
    logger.warn("loud line {}", 42);

    EXPECT_FALSE(capture.contains("quiet line"));
    EXPECT_TRUE(capture.contains("[logtest_capture] [warning] loud line 42"));
}

TEST(LogTest, FileSinkReceivesFlushedLines) {
    auto path = std::filesystem::temp_directory_path() /
                ("rcp_log_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    logging::LogConfig config;
    config.console = false;
    config.file_path = path.string();
    logging::init(config);

    logging::Logger::get("logtest_file").info("written to file");
    logging::flush();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("written to file"), std::string::npos);

    logging::init(logging::LogConfig{});
    std::filesystem::remove(path);
}
