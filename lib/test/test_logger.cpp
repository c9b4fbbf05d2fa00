#include "Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace {

class CaptureHandler : public pwl::logging::Handler {
public:
  void emit(pwl::logging::Level level, const std::string &message) override {
    if (level >= level_) {
      messages.push_back(message);
    }
  }

  std::vector<std::string> messages;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = pwl::logging::getRootLogger();
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
    rootLogger.error << "Error message";
    rootLogger.critical << "Critical message";
  });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
  auto logger = pwl::logging::getLogger("myapp.part");
  EXPECT_EQ(logger.getName(), "part");
  EXPECT_EQ(logger.getFullName(), "myapp.part");
  EXPECT_EQ(logger, pwl::logging::getLogger("myapp.part"));
}

TEST(LoggerTest, StreamedPiecesFormOneRecord) {
  auto logger = pwl::logging::getLogger("capture_single");
  auto handler = std::make_shared<CaptureHandler>();
  logger.addHandler(handler);
  logger.setPropagate(false);

  logger.info << "nonce=" << 42 << " hash=" << "00ab";

  ASSERT_EQ(handler->messages.size(), 1u);
  const std::string &msg = handler->messages[0];
  EXPECT_NE(msg.find("[INFO] [capture_single] nonce=42 hash=00ab"),
            std::string::npos);
}

TEST(LoggerTest, LevelFiltersMessages) {
  auto logger = pwl::logging::getLogger("capture_level");
  auto handler = std::make_shared<CaptureHandler>();
  logger.addHandler(handler);
  logger.setPropagate(false);
  logger.setLevel(pwl::logging::Level::WARNING);

  logger.debug << "d";
  logger.info << "i";
  logger.warning << "w";
  logger.error << "e";

  EXPECT_EQ(handler->messages.size(), 2u);
}

TEST(LoggerTest, ChildRecordsReachParentHandlers) {
  auto parent = pwl::logging::getLogger("capture_parent");
  auto handler = std::make_shared<CaptureHandler>();
  parent.addHandler(handler);
  parent.setPropagate(false);

  pwl::logging::getLogger("capture_parent.child").info << "hello";

  ASSERT_EQ(handler->messages.size(), 1u);
  EXPECT_NE(handler->messages[0].find("[capture_parent.child] hello"),
            std::string::npos);
}

TEST(LoggerTest, RedirectMovesLoggerUnderTarget) {
  auto target = pwl::logging::getLogger("capture_target");
  auto handler = std::make_shared<CaptureHandler>();
  target.addHandler(handler);
  target.setPropagate(false);

  auto logger = pwl::logging::getLogger("capture_redirected");
  logger.redirectTo("capture_target");
  EXPECT_EQ(logger.getFullName(), "capture_target.capture_redirected");

  logger.warning << "moved";
  ASSERT_EQ(handler->messages.size(), 1u);
  EXPECT_NE(handler->messages[0].find("[WARNING]"), std::string::npos);
}

TEST(LoggerTest, RedirectRejectsCycles) {
  auto a = pwl::logging::getLogger("cycle_a");
  auto b = pwl::logging::getLogger("cycle_a.b");
  EXPECT_THROW(a.redirectTo("cycle_a"), std::invalid_argument);
  EXPECT_THROW(a.redirectTo("cycle_a.b"), std::invalid_argument);
}

TEST(LoggerTest, FileHandlerWritesRecords) {
  auto path = std::filesystem::temp_directory_path() / "powledger_logger_test.log";
  std::filesystem::remove(path);
  {
    auto logger = pwl::logging::getLogger("file_test");
    logger.setPropagate(false);
    logger.addFileHandler(path.string(), pwl::logging::Level::INFO);
    logger.debug << "skipped";
    logger.info << "written";
    logger.clearHandlers();
  }

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("written"), std::string::npos);
  EXPECT_EQ(content.find("skipped"), std::string::npos);
  std::filesystem::remove(path);
}
