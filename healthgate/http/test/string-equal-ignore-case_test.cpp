#include "healthgate/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace healthgate {

TEST(StringEqualIgnoreCaseTest, HeaderNames) {
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Length", "content-length"));
  EXPECT_TRUE(CaseInsensitiveEqual("CONNECTION", "Connection"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("Host", "Hosts"));
  EXPECT_FALSE(CaseInsensitiveEqual("X-A", "X_A"));
  static_assert(CaseInsensitiveEqual("Keep-Alive", "keep-alive"));
}

TEST(StringEqualIgnoreCaseTest, TrimOws) {
  EXPECT_EQ(TrimOws("  close\t"), "close");
  EXPECT_EQ(TrimOws("keep-alive"), "keep-alive");
  EXPECT_EQ(TrimOws("a b"), "a b");
  EXPECT_EQ(TrimOws(" \t "), "");
  EXPECT_EQ(TrimOws(""), "");
  // Only SP and HTAB are optional whitespace.
  EXPECT_EQ(TrimOws("\r\nx"), "\r\nx");
}

}  // namespace healthgate
