#include <gtest/gtest.h>

#include <Config.hpp>
#include <SimClock.hpp>
#include <SimClockSettings.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;

namespace {
std::filesystem::path writeTempConfig(const std::string& content) {
  const auto stamp =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("timewarp_settings_test_" + std::to_string(stamp) + ".yaml");
  std::ofstream out(path);
  out << content;
  out.close();
  return path;
}
}  // namespace

TEST(SimClockSettingsTests, ReadsAllKeys) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startDate: "2024-01-01"
    startTime: "06:30"
    timeZone: Europe/Warsaw
    multiplier: 12.5
    syncTimeoutMS: 750
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  const auto settings = loadSimClockSettings();

  EXPECT_EQ(settings.startDate, "2024-01-01");
  EXPECT_EQ(settings.startTime, "06:30");
  EXPECT_EQ(settings.timeZone, "Europe/Warsaw");
  EXPECT_DOUBLE_EQ(settings.multiplier, 12.5);
  EXPECT_EQ(settings.syncTimeout, 750ms);

  std::filesystem::remove(configPath);
}

TEST(SimClockSettingsTests, OptionalKeysFallBackToDefaults) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startDate: "2030-12-31"
    startTime: "23:59"
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  const auto settings = loadSimClockSettings();

  EXPECT_EQ(settings.timeZone, "UTC");
  EXPECT_DOUBLE_EQ(settings.multiplier, 1.0);
  EXPECT_EQ(settings.syncTimeout, 5000ms);

  std::filesystem::remove(configPath);
}

TEST(SimClockSettingsTests, MissingStartDateThrows) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startTime: "00:00"
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)loadSimClockSettings(), std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(SimClockSettingsTests, NonNumericMultiplierThrows) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startDate: "2024-01-01"
    startTime: "00:00"
    multiplier: fast
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)loadSimClockSettings(), std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(SimClockSettingsTests, NonPositiveSyncTimeoutThrows) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startDate: "2024-01-01"
    startTime: "00:00"
    syncTimeoutMS: 0
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)loadSimClockSettings(), std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(SimClockSettingsTests, LoadedSettingsBuildClockOnSystemTime) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SimClock:
    startDate: "2024-01-01"
    startTime: "00:00"
    multiplier: 1.0
)yaml");

  tw::Config::instance().setConfigPath(configPath.string());
  const auto clock = SimClock::create(loadSimClockSettings());
  ASSERT_TRUE(clock.has_value());

  const auto start = *tw::parseRfc3339("2024-01-01T00:00:00Z");
  const auto elapsed = (*clock)->now() - start;
  EXPECT_GE(elapsed, 0ns);
  EXPECT_LT(elapsed, 5s);

  std::filesystem::remove(configPath);
}
