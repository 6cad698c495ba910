#include "routekit/cctype.hpp"

#include <gtest/gtest.h>

namespace routekit {

static_assert(isdigit('0'), "digit compile-time");
static_assert(!isdigit('a'), "digit compile-time false");
static_assert(isword('_'), "isword compile-time");
static_assert(!isword('/'), "isword compile-time false");

TEST(Cctype, IsDigitBasic) {
  EXPECT_TRUE(isdigit('0'));
  EXPECT_TRUE(isdigit('9'));

  EXPECT_FALSE(isdigit('/'));
  EXPECT_FALSE(isdigit(':'));
  EXPECT_FALSE(isdigit('a'));
}

TEST(Cctype, IsLowerUpper) {
  EXPECT_TRUE(islower('a'));
  EXPECT_TRUE(islower('z'));
  EXPECT_FALSE(islower('A'));
  EXPECT_FALSE(islower('`'));

  EXPECT_TRUE(isupper('A'));
  EXPECT_TRUE(isupper('Z'));
  EXPECT_FALSE(isupper('a'));
  EXPECT_FALSE(isupper('['));
}

TEST(Cctype, ToUpperOnlyChangesLowerCaseLetters) {
  EXPECT_EQ(toupper('a'), 'A');
  EXPECT_EQ(toupper('z'), 'Z');
  EXPECT_EQ(toupper('Q'), 'Q');
  EXPECT_EQ(toupper('7'), '7');
  EXPECT_EQ(toupper('_'), '_');
}

TEST(Cctype, IsWordAcceptsLettersDigitsUnderscore) {
  for (char ch = 'a'; ch <= 'z'; ++ch) {
    EXPECT_TRUE(isword(ch)) << ch;
  }
  for (char ch = 'A'; ch <= 'Z'; ++ch) {
    EXPECT_TRUE(isword(ch)) << ch;
  }
  for (char ch = '0'; ch <= '9'; ++ch) {
    EXPECT_TRUE(isword(ch)) << ch;
  }
  EXPECT_TRUE(isword('_'));
}

TEST(Cctype, IsWordRejectsSeparatorsAndNonAscii) {
  for (char ch : {'/', '-', ' ', '.', ':', '{', '}', '\t', '\0', '@', '~'}) {
    EXPECT_FALSE(isword(ch)) << static_cast<int>(ch);
  }
  EXPECT_FALSE(isword(static_cast<char>(0xC3)));
}

}  // namespace routekit
