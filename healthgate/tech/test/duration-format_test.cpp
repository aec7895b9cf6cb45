#include "healthgate/duration-format.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace healthgate {

namespace {
std::string FormatDuration(std::chrono::nanoseconds duration) { return fmt::format("{}", PrettyDuration{duration}); }
}  // namespace

TEST(DurationFormatTest, ZeroDuration) { EXPECT_EQ(FormatDuration(std::chrono::nanoseconds::zero()), "0s"); }

TEST(DurationFormatTest, SingleUnits) {
  EXPECT_EQ(FormatDuration(std::chrono::seconds(15)), "15s");
  EXPECT_EQ(FormatDuration(std::chrono::milliseconds(250)), "250ms");
  EXPECT_EQ(FormatDuration(std::chrono::hours(2)), "2h");
  EXPECT_EQ(FormatDuration(std::chrono::nanoseconds(7)), "7ns");
}

TEST(DurationFormatTest, Composite) {
  EXPECT_EQ(FormatDuration(std::chrono::minutes(1) + std::chrono::seconds(30) + std::chrono::milliseconds(5)),
            "1m30s5ms");
}

TEST(DurationFormatTest, LimitUnits) {
  PrettyDuration dur{std::chrono::hours(3) + std::chrono::minutes(4) + std::chrono::seconds(5) +
                     std::chrono::milliseconds(6)};
  EXPECT_EQ(fmt::format("{:1}", dur), "3h");
  EXPECT_EQ(fmt::format("{:2}", dur), "3h4m");
  EXPECT_EQ(fmt::format("{:3}", dur), "3h4m5s");
  EXPECT_EQ(fmt::format("{}", dur), "3h4m5s6ms");
}

TEST(DurationFormatTest, Negative) { EXPECT_EQ(FormatDuration(-std::chrono::seconds(3)), "-3s"); }

}  // namespace healthgate
