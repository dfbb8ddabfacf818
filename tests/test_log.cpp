/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "zbeacon/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct Captured {
  zbeacon::log::Level level;
  std::string category;
  std::string message;
};

void CaptureSink(zbeacon::log::Level level, const char* category,
                 const char* message, void* context) {
  auto* lines = static_cast<std::vector<Captured>*>(context);
  lines->push_back(Captured{level, category, message});
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(zbeacon::log::GetLevel() == zbeacon::log::Level::kInfo);
#else
  REQUIRE(zbeacon::log::GetLevel() == zbeacon::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = zbeacon::log::GetLevel();
  zbeacon::log::SetLevel(zbeacon::log::Level::kError);
  REQUIRE(zbeacon::log::GetLevel() == zbeacon::log::Level::kError);
  REQUIRE_FALSE(zbeacon::log::IsEnabled(zbeacon::log::Level::kWarn));
  REQUIRE(zbeacon::log::IsEnabled(zbeacon::log::Level::kError));
  zbeacon::log::SetLevel(prev);  // restore
}

TEST_CASE("Log kOff is never enabled", "[log]") {
  auto prev = zbeacon::log::GetLevel();
  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);
  REQUIRE_FALSE(zbeacon::log::IsEnabled(zbeacon::log::Level::kOff));
  zbeacon::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!zbeacon::log::IsInitialized());
  REQUIRE(zbeacon::log::Init());
  REQUIRE(zbeacon::log::IsInitialized());
  zbeacon::log::Shutdown();
  REQUIRE(!zbeacon::log::IsInitialized());
}

TEST_CASE("Log Init writes to a file", "[log]") {
  char path[] = "/tmp/zbeacon_log_XXXXXX";
  int fd = ::mkstemp(path);
  REQUIRE(fd >= 0);
  ::close(fd);

  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);
  REQUIRE(zbeacon::log::Init(path));
  ZBEACON_LOG_WARN("Beacon", "send failed %d", 3);
  zbeacon::log::Shutdown();

  FILE* f = std::fopen(path, "r");
  REQUIRE(f != nullptr);
  char line[512] = {};
  REQUIRE(std::fgets(line, sizeof(line), f) != nullptr);
  std::fclose(f);
  ::unlink(path);

  REQUIRE(std::strstr(line, "[WARN]") != nullptr);
  REQUIRE(std::strstr(line, "[Beacon]") != nullptr);
  REQUIRE(std::strstr(line, "send failed 3") != nullptr);
  REQUIRE(std::strstr(line, "test_log.cpp:") != nullptr);
}

TEST_CASE("Log Init with unwritable path fails", "[log]") {
  REQUIRE_FALSE(zbeacon::log::Init("/nonexistent_dir/zbeacon.log"));
  zbeacon::log::Shutdown();
}

TEST_CASE("Log macros compile and run", "[log]") {
  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);
  // These should not crash
  ZBEACON_LOG_DEBUG("Test", "debug %d", 1);
  ZBEACON_LOG_INFO("Test", "info %s", "msg");
  ZBEACON_LOG_WARN("Test", "warn");
  ZBEACON_LOG_ERROR("Test", "error %d %d", 1, 2);
  // Don't test FATAL as it calls abort()
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);
  std::string long_msg(600, 'x');
  ZBEACON_LOG_INFO("Test", "%s", long_msg.c_str());
  REQUIRE(true);
}

// ============================================================================
// Logger
// ============================================================================

TEST_CASE("Logger forwards formatted lines to its sink", "[log][logger]") {
  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);
  std::vector<Captured> lines;
  zbeacon::log::Logger logger("zbeacon.agent", &CaptureSink, &lines);

  logger.Debug("command %s", "Publish");
  logger.Warn("recv failed (errno %d)", 11);
  logger.Error("socket reset failed");

  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0].level == zbeacon::log::Level::kDebug);
  REQUIRE(lines[0].category == "zbeacon.agent");
  REQUIRE(lines[0].message == "command Publish");
  REQUIRE(lines[1].level == zbeacon::log::Level::kWarn);
  REQUIRE(lines[1].message == "recv failed (errno 11)");
  REQUIRE(lines[2].level == zbeacon::log::Level::kError);
}

TEST_CASE("Logger honors the runtime level", "[log][logger]") {
  std::vector<Captured> lines;
  zbeacon::log::Logger logger("zbeacon", &CaptureSink, &lines);

  zbeacon::log::SetLevel(zbeacon::log::Level::kWarn);
  logger.Debug("filtered");
  logger.Info("filtered");
  logger.Warn("kept");
  zbeacon::log::SetLevel(zbeacon::log::Level::kDebug);  // restore

  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].message == "kept");
}

TEST_CASE("Logger without sink writes to the process log", "[log][logger]") {
  zbeacon::log::Logger logger;
  REQUIRE(std::strcmp(logger.Category(), "zbeacon") == 0);
  logger.Info("default logger %d", 1);
  REQUIRE(true);
}
