#include "hellonet/string-trim.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace hellonet {

TEST(StringTrimTest, TrimsSpacesAndTabs) {
  EXPECT_EQ(TrimOws("  hello  "), std::string_view("hello"));
  EXPECT_EQ(TrimOws("\thello\t"), std::string_view("hello"));
  EXPECT_EQ(TrimOws(" \thello \t"), std::string_view("hello"));
}

TEST(StringTrimTest, OwsPreservesOtherWhitespace) {
  EXPECT_EQ(TrimOws("\nhello\n"), std::string_view("\nhello\n"));
  EXPECT_EQ(TrimOws(" \nhello\n "), std::string_view("\nhello\n"));
}

TEST(StringTrimTest, EmptyAndAllWhitespace) {
  EXPECT_EQ(TrimOws(""), std::string_view(""));
  EXPECT_EQ(TrimOws("   \t  "), std::string_view(""));
  EXPECT_EQ(TrimSpaces(" \r\n\t "), std::string_view(""));
}

TEST(StringTrimTest, TrimSpacesRemovesAllAsciiWhitespace) {
  EXPECT_EQ(TrimSpaces("\n 0.0.0.0 \r\n"), std::string_view("0.0.0.0"));
  EXPECT_EQ(TrimSpaces("  hello world  "), std::string_view("hello world"));
  EXPECT_EQ(TrimSpaces("production"), std::string_view("production"));
}

}  // namespace hellonet
