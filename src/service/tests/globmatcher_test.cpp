#include <gtest/gtest.h>

#include "../include/globmatcher.hpp"

TEST(GlobMatcherTest, StarMatchesEverything) {
  GlobMatcher glob("*");
  EXPECT_TRUE(glob.matches("a.txt"));
  EXPECT_TRUE(glob.matches(".hidden"));
  EXPECT_TRUE(glob.matches(""));
}

TEST(GlobMatcherTest, ExtensionMask) {
  GlobMatcher glob("*.tmp");
  EXPECT_TRUE(glob.matches("b.tmp"));
  EXPECT_FALSE(glob.matches("a.txt"));
  EXPECT_FALSE(glob.matches("b.tmp.bak"));
  // Регистр учитывается
  EXPECT_FALSE(glob.matches("B.TMP"));
}

TEST(GlobMatcherTest, QuestionMarkAndClasses) {
  EXPECT_TRUE(GlobMatcher("file?.csv").matches("file1.csv"));
  EXPECT_FALSE(GlobMatcher("file?.csv").matches("file10.csv"));
  EXPECT_TRUE(GlobMatcher("[ab]*.dat").matches("a1.dat"));
  EXPECT_FALSE(GlobMatcher("[ab]*.dat").matches("c1.dat"));
  EXPECT_TRUE(GlobMatcher("[!ab]*.dat").matches("c1.dat"));
  EXPECT_FALSE(GlobMatcher("[!ab]*.dat").matches("a1.dat"));
}

TEST(GlobMatcherTest, BraceAlternatives) {
  GlobMatcher glob("*.{csv,xml}");
  EXPECT_TRUE(glob.matches("report.csv"));
  EXPECT_TRUE(glob.matches("report.xml"));
  EXPECT_FALSE(glob.matches("report.json"));
}

TEST(GlobMatcherTest, RegexMetacharactersAreLiteral) {
  GlobMatcher glob("data+(1).txt");
  EXPECT_TRUE(glob.matches("data+(1).txt"));
  EXPECT_FALSE(glob.matches("dataa(1).txt"));
  EXPECT_FALSE(GlobMatcher("a.b").matches("axb"));
}

TEST(GlobMatcherTest, InvalidPatternsRejected) {
  EXPECT_THROW(GlobMatcher(""), std::invalid_argument);
  EXPECT_THROW(GlobMatcher("[abc"), std::invalid_argument);
  EXPECT_THROW(GlobMatcher("*.{csv"), std::invalid_argument);
  EXPECT_FALSE(GlobMatcher::isValid("{a,{b}}"));
  EXPECT_TRUE(GlobMatcher::isValid("*.txt"));
}
