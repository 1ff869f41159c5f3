#include <gtest/gtest.h>

#include "framestream/log_window.hpp"
#include "framestream/logger.hpp"
#include "framestream/time_format.hpp"
#include "test_support.hpp"

#include <filesystem>

namespace framestream {
namespace {

using test_support::list_files;
using test_support::read_lines;
using test_support::TempDir;

class LogWindowTest : public ::testing::Test {
protected:
    void SetUp() override { apply_timezone("UTC"); }

    LogWindow::Config config(double interval, const std::string& header = "") const {
        LogWindow::Config c;
        c.directory = dir_.path();
        c.interval = interval;
        c.extension = ".jsonl";
        c.header = header;
        return c;
    }

    TempDir dir_;
};

TEST_F(LogWindowTest, RotatesAfterIntervalOnPollCycle) {
    LogWindow window(config(5.0));

    ASSERT_TRUE(window.append("{\"n\":0}", 0.0));
    EXPECT_TRUE(window.is_open());
    EXPECT_DOUBLE_EQ(window.start_time(), 0.0);
    EXPECT_EQ(list_files(dir_.path()),
              (std::vector<std::string>{"transferring.1970-01-01_00:00:00.000+0000.jsonl"}));

    EXPECT_FALSE(window.expire(5.0));
    EXPECT_TRUE(window.is_open());

    EXPECT_TRUE(window.expire(6.0));
    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(list_files(dir_.path()),
              (std::vector<std::string>{"1970-01-01_00:00:00.000+0000.jsonl"}));

    ASSERT_TRUE(window.append("{\"n\":1}", 6.1));
    EXPECT_TRUE(window.is_open());
    EXPECT_DOUBLE_EQ(window.start_time(), 6.1);
    EXPECT_EQ(list_files(dir_.path()),
              (std::vector<std::string>{"1970-01-01_00:00:00.000+0000.jsonl",
                                        "transferring.1970-01-01_00:00:06.100+0000.jsonl"}));
    EXPECT_EQ(window.published_count(), 1u);
}

TEST_F(LogWindowTest, GroupsRecordsWithinWindow) {
    LogWindow window(config(10.0));
    ASSERT_TRUE(window.append("a", 100.0));
    ASSERT_TRUE(window.append("b", 104.0));
    ASSERT_TRUE(window.append("c", 109.0));
    window.close();

    const auto files = list_files(dir_.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_lines(dir_.path() + "/" + files[0]),
              (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(LogWindowTest, HeaderStartsEveryFile) {
    LogWindow window(config(1.0, "source_id,frame_time"));
    ASSERT_TRUE(window.append("s,1", 1.0));
    ASSERT_TRUE(window.expire(2.5));
    ASSERT_TRUE(window.append("s,3", 3.0));
    window.close();

    const auto files = list_files(dir_.path());
    ASSERT_EQ(files.size(), 2u);
    for (const auto& name : files) {
        const auto lines = read_lines(dir_.path() + "/" + name);
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0], "source_id,frame_time");
    }
}

TEST_F(LogWindowTest, ExpireWithoutWindowDoesNothing) {
    LogWindow window(config(1.0));
    EXPECT_FALSE(window.expire(1e9));
    window.close();
    EXPECT_TRUE(list_files(dir_.path()).empty());
}

TEST_F(LogWindowTest, DestructorPublishesOpenWindow) {
    {
        LogWindow window(config(60.0));
        ASSERT_TRUE(window.append("x", 0.0));
    }
    EXPECT_EQ(list_files(dir_.path()),
              (std::vector<std::string>{"1970-01-01_00:00:00.000+0000.jsonl"}));
}

TEST_F(LogWindowTest, RenameFailureRemovesTempFileAndContinues) {
    // A non-empty directory at the destination makes rename() fail.
    const std::string blocker = dir_.path() + "/1970-01-01_00:00:00.000+0000.jsonl";
    std::filesystem::create_directory(blocker);
    std::filesystem::create_directory(blocker + "/occupied");

    std::vector<std::string> warnings;
    Logger::set_error_sink([&warnings](const std::string& line) { warnings.push_back(line); });

    LogWindow window(config(1.0));
    ASSERT_TRUE(window.append("x", 0.0));
    EXPECT_TRUE(window.expire(2.0));
    Logger::set_error_sink(nullptr);

    EXPECT_FALSE(window.is_open());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].rfind("Failed to rename", 0), 0u);
    EXPECT_EQ(window.failed_count(), 1u);
    EXPECT_EQ(list_files(dir_.path()),
              (std::vector<std::string>{"1970-01-01_00:00:00.000+0000.jsonl"}));

    ASSERT_TRUE(window.append("y", 10.0));
    window.close();
    EXPECT_EQ(window.published_count(), 1u);
}

TEST_F(LogWindowTest, MissingDirectoryFailsAppend) {
    LogWindow::Config c = config(1.0);
    c.directory = dir_.path() + "/missing";
    LogWindow window(c);
    EXPECT_FALSE(window.append("x", 0.0));
    EXPECT_FALSE(window.is_open());
}

} // namespace
} // namespace framestream
