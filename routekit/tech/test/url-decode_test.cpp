#include "routekit/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>

namespace routekit {

namespace {
std::string StrictDecode(std::string input, char plusAs = '+') {
  char* end = url::DecodeInPlace(input.data(), input.data() + input.size(), plusAs, true);
  if (end == nullptr) {
    return "<invalid>";
  }
  input.resize(static_cast<std::size_t>(end - input.data()));
  return input;
}
}  // namespace

TEST(UrlDecode, Basic) {
  EXPECT_EQ(StrictDecode("abc"), "abc");
  EXPECT_EQ(StrictDecode("a%20b"), "a b");
  EXPECT_EQ(StrictDecode("%41%42%43"), "ABC");
  EXPECT_EQ(StrictDecode("%e2%82%ac"), "\xE2\x82\xAC");
}

TEST(UrlDecode, PlusHandling) {
  EXPECT_EQ(StrictDecode("a+b"), "a+b");
  EXPECT_EQ(StrictDecode("a+b", ' '), "a b");
}

TEST(UrlDecode, StrictRejectsInvalid) {
  EXPECT_EQ(StrictDecode("%"), "<invalid>");
  EXPECT_EQ(StrictDecode("%4"), "<invalid>");
  EXPECT_EQ(StrictDecode("%G1"), "<invalid>");
}

TEST(UrlDecode, ComponentIsBestEffort) {
  EXPECT_EQ(url::DecodeComponent("john%20doe"), "john doe");
  EXPECT_EQ(url::DecodeComponent("100%"), "100%");
  EXPECT_EQ(url::DecodeComponent("%zz-ok"), "%zz-ok");
  EXPECT_EQ(url::DecodeComponent("a%2"), "a%2");
  EXPECT_EQ(url::DecodeComponent("a%2Fb"), "a/b");
}

TEST(UrlDecode, ComponentPlusAsSpace) {
  EXPECT_EQ(url::DecodeComponent("hello+world", ' '), "hello world");
  EXPECT_EQ(url::DecodeComponent("hello+world"), "hello+world");
  EXPECT_EQ(url::DecodeComponent(""), "");
}

}  // namespace routekit
