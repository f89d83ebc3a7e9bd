#include "utf8.hpp"

#include <gtest/gtest.h>

using namespace fsutils;

TEST(Utf8, ValidInputIsUnchanged) {
  std::string text = "plain ascii\n\xC3\xA9t\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\r\n";
  EXPECT_TRUE(utf8::is_valid(text));
  EXPECT_EQ(text, utf8::decode_lossy(text));
}

TEST(Utf8, EmptyInput) {
  EXPECT_TRUE(utf8::is_valid(""));
  EXPECT_EQ("", utf8::decode_lossy(""));
}

TEST(Utf8, StrayContinuationByte) {
  EXPECT_FALSE(utf8::is_valid("a\x80z"));
  EXPECT_EQ("a\xEF\xBF\xBDz", utf8::decode_lossy("a\x80z"));
}

TEST(Utf8, InvalidLeadBytes) {
  EXPECT_EQ("\xEF\xBF\xBD\xEF\xBF\xBD", utf8::decode_lossy("\xC0\xFF"));
}

TEST(Utf8, TruncatedSequenceIsOneReplacement) {
  // First two bytes of the euro sign, cut off by the end of the buffer
  EXPECT_EQ("x\xEF\xBF\xBD", utf8::decode_lossy("x\xE2\x82"));
  // Cut off by an ASCII byte
  EXPECT_EQ("\xEF\xBF\xBDy", utf8::decode_lossy("\xE2\x82y"));
}

TEST(Utf8, SurrogatesAndOverlongForms) {
  // Encoded surrogate U+D800
  EXPECT_FALSE(utf8::is_valid("\xED\xA0\x80"));
  // Overlong encoding of '/'
  EXPECT_FALSE(utf8::is_valid("\xE0\x80\xAF"));
  // Above U+10FFFF
  EXPECT_FALSE(utf8::is_valid("\xF4\x90\x80\x80"));
}

TEST(Utf8, SequenceSplitByByteOffset) {
  // Tail by bytes may start in the middle of a character
  std::string text = "\xE2\x82\xAC" "abc";
  EXPECT_EQ("\xEF\xBF\xBD\xEF\xBF\xBD" "abc", utf8::decode_lossy(text.substr(1)));
}
