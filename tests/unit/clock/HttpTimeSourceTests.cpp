#include <gtest/gtest.h>

#include <HttpTimeSource.hpp>
#include <TimeFormat.hpp>

#include <string>

#include "clock/fakes/FakeHttpTransport.hpp"

using tw::ESimClockError;

namespace {
constexpr auto kAddress = "http://authority.example/time";
}

TEST(HttpTimeSourceTests, DecodesSimulatedTimeField) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);
  transport.respondWith(200, R"({"simulated_time": "2024-03-10T08:30:00Z"})");

  const auto result = source.fetchSimulatedTime(kAddress);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, *tw::parseRfc3339("2024-03-10T08:30:00Z"));
  ASSERT_EQ(transport.requests().size(), 1u);
  EXPECT_EQ(transport.requests().front(), kAddress);
}

TEST(HttpTimeSourceTests, IgnoresUnrelatedFields) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);
  transport.respondWith(
      200,
      R"({"server": "sim-1", "simulated_time": "2024-03-10T10:30:00+02:00", "rate": 4})");

  const auto result = source.fetchSimulatedTime(kAddress);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, *tw::parseRfc3339("2024-03-10T08:30:00Z"));
}

TEST(HttpTimeSourceTests, TransportFailureIsFetchError) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);
  transport.failWith("connect: Connection refused");

  const auto result = source.fetchSimulatedTime(kAddress);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ESimClockError::FetchError);
  EXPECT_NE(result.error().message.find("Connection refused"),
            std::string::npos);
}

TEST(HttpTimeSourceTests, NonSuccessStatusIsFetchError) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);

  for (const int status : {301, 404, 500, 503}) {
    transport.respondWith(status,
                          R"({"simulated_time": "2024-03-10T08:30:00Z"})");
    const auto result = source.fetchSimulatedTime(kAddress);
    ASSERT_FALSE(result.has_value()) << status;
    EXPECT_EQ(result.error().code, ESimClockError::FetchError);
    EXPECT_NE(result.error().message.find(std::to_string(status)),
              std::string::npos);
  }
}

TEST(HttpTimeSourceTests, MalformedBodyIsTimeFormatError) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);

  for (const std::string body :
       {"", "not json", R"({"simulated_time": )", R"(["2024-03-10T08:30:00Z"])",
        R"({"other": "2024-03-10T08:30:00Z"})", R"({"simulated_time": 1710059400})",
        R"({"simulated_time": null})"}) {
    transport.respondWith(200, body);
    const auto result = source.fetchSimulatedTime(kAddress);
    ASSERT_FALSE(result.has_value()) << body;
    EXPECT_EQ(result.error().code, ESimClockError::TimeFormatError) << body;
  }
}

TEST(HttpTimeSourceTests, InvalidTimestampIsParseError) {
  FakeHttpTransport transport;
  HttpTimeSource source(transport);

  for (const std::string stamp :
       {"", "2024-03-10 08:30:00", "2024-03-10T08:30:00", "2024-13-10T08:30:00Z",
        "yesterday"}) {
    transport.respondWith(200, R"({"simulated_time": ")" + stamp + R"("})");
    const auto result = source.fetchSimulatedTime(kAddress);
    ASSERT_FALSE(result.has_value()) << stamp;
    EXPECT_EQ(result.error().code, ESimClockError::ParseError) << stamp;
  }
}
