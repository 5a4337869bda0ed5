#include "gtest/gtest.h"
#include "utilities/logger.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace arloader;

// Helper function to read file contents
static std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs)
    return "";
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// Helper function to count occurrences of a substring
static int countOccurrences(const std::string &text, const std::string &sub) {
  int count = 0;
  size_t pos = text.find(sub, 0);
  while (pos != std::string::npos) {
    count++;
    pos = text.find(sub, pos + sub.length());
  }
  return count;
}

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
  std::vector<std::string> files_to_remove_;

  void TearDown() override {
    // Point the singleton back at the suite log so the test files can go.
    Logger::init((std::filesystem::temp_directory_path() / "arloader_test_var" /
                  "arloader_tests.log")
                     .string(),
                 LogLevel::DEBUG);
    for (const auto &file : files_to_remove_)
      std::remove(file.c_str());
    files_to_remove_.clear();
  }

  std::string testFile(const std::string &name) {
    std::string path = (std::filesystem::temp_directory_path() / name).string();
    files_to_remove_.push_back(path);
    std::remove(path.c_str());
    return path;
  }
};

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string testLogFile = testFile("arloader_level_filter.log");

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

  logger.log(LogLevel::TRACE, "This is a trace message.");
  logger.log(LogLevel::DEBUG, "This is a debug message.");
  logger.log(LogLevel::INFO, "This is an info message.");
  logger.log(LogLevel::WARN, "This is a warning message.");
  logger.log(LogLevel::ERROR, "This is an error message.");
  logger.log(LogLevel::FATAL, "This is a fatal message.");

  std::string logContents = readFileContents(testLogFile);
  ASSERT_NE(logContents, "");

  EXPECT_EQ(countOccurrences(logContents, "This is a trace message."), 0);
  EXPECT_EQ(countOccurrences(logContents, "This is a debug message."), 0);
  EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
  EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
  EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
  EXPECT_NE(logContents.find("This is a fatal message."), std::string::npos);
}

TEST_F(LoggerTest, JsonLines) {
  const std::string testLogFile = testFile("arloader_json_format.log");

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO, "special chars \" \\ / \n \t");
  Logger::getInstance().log(LogLevel::WARN, "second");

  std::string contents = readFileContents(testLogFile);
  EXPECT_NE(contents.find("\"level\":\"WARN\""), std::string::npos);
  std::istringstream lines(contents);
  std::string line;
  std::vector<nlohmann::json> records;
  while (std::getline(lines, line))
    records.push_back(nlohmann::json::parse(line));

  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].at("level").get<std::string>(), "INFO");
  EXPECT_EQ(records[0].at("message").get<std::string>(), "special chars \" \\ / \n \t");
  EXPECT_EQ(records[0].at("timestamp").get<std::string>().size(), 19u);
  EXPECT_EQ(records[1].at("level").get<std::string>(), "WARN");
}

TEST_F(LoggerTest, InvalidUtf8IsReplaced) {
  const std::string testLogFile = testFile("arloader_utf8.log");

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO, std::string("bad \xff name"));

  std::string contents = readFileContents(testLogFile);
  ASSERT_FALSE(contents.empty());
  nlohmann::json record = nlohmann::json::parse(contents);
  EXPECT_NE(record.at("message").get<std::string>().find("\xEF\xBF\xBD"),
            std::string::npos);
}

TEST_F(LoggerTest, LogRotation) {
  const std::string baseLogFile = testFile("arloader_rotation.log");
  const int maxBackupFiles = 2;
  const long long maxFileSize = 1024;
  for (int i = 1; i <= maxBackupFiles + 1; ++i)
    testFile("arloader_rotation.log." + std::to_string(i));

  ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles));
  Logger &logger = Logger::getInstance();

  // ~800 bytes each, so every second record rotates the file.
  std::string singleMessage = "Rotation test message, long enough to fill the log quickly. ";
  while (singleMessage.size() < 800)
    singleMessage += singleMessage;
  for (int i = 0; i < 6; ++i)
    logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));

  EXPECT_TRUE(std::filesystem::exists(baseLogFile));
  EXPECT_TRUE(std::filesystem::exists(baseLogFile + ".1"));
  EXPECT_TRUE(std::filesystem::exists(baseLogFile + ".2"));
  EXPECT_FALSE(std::filesystem::exists(baseLogFile + ".3"));
}

TEST_F(LoggerTest, LogRotationNoBackups) {
  const std::string baseLogFile = testFile("arloader_no_backup.log");
  testFile("arloader_no_backup.log.1");

  ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 512, 0));
  Logger &logger = Logger::getInstance();

  std::string singleMessage(280, 'n');
  for (int i = 0; i < 5; ++i)
    logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));

  EXPECT_TRUE(std::filesystem::exists(baseLogFile));
  EXPECT_FALSE(std::filesystem::exists(baseLogFile + ".1"));
  EXPECT_EQ(countOccurrences(readFileContents(baseLogFile), " #0"), 0);
}

TEST_F(LoggerTest, ReinitializationTest) {
  const std::string logFile1 = testFile("arloader_reinit1.log");
  const std::string logFile2 = testFile("arloader_reinit2.log");

  ASSERT_NO_THROW(Logger::init(logFile1, LogLevel::INFO));
  Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

  ASSERT_NO_THROW(Logger::init(logFile2, LogLevel::WARN));
  Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
  Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");

  std::string contents1 = readFileContents(logFile1);
  EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
  EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);

  std::string contents2 = readFileContents(logFile2);
  EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
  EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
  EXPECT_EQ(contents2.find("Message for logfile1"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
  EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::ERROR);
  EXPECT_EQ(Logger::levelFromString("Trace"), LogLevel::TRACE);
  EXPECT_EQ(Logger::levelFromString("chatty"), LogLevel::WARN);

  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::ERROR);
  Logger::getInstance().setLogLevel(LogLevel::INFO);
  EXPECT_EQ(Logger::getInstance().logLevel(), LogLevel::INFO);
}
