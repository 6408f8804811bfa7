// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include <string>

#include <gtest/gtest.h>

#include "common/utf8.hpp"

using std::string;

namespace jailer {
namespace internal {
namespace tests {

TEST(Utf8Test, WellFormedInputIsUnchanged)
{
  const string ascii = "hello\nworld\t!";
  EXPECT_TRUE(utf8::valid(ascii));
  EXPECT_EQ(ascii, utf8::sanitize(ascii));

  // Two, three and four byte sequences.
  const string multibyte =
    "gr\xC3\xBC\xC3\x9F" "e, \xE6\x97\xA5\xE6\x9C\xAC, \xF0\x9F\x98\x80";
  EXPECT_TRUE(utf8::valid(multibyte));
  EXPECT_EQ(multibyte, utf8::sanitize(multibyte));

  EXPECT_TRUE(utf8::valid(""));
  EXPECT_EQ("", utf8::sanitize(""));
}


TEST(Utf8Test, InvalidBytesAreReplaced)
{
  const string replacement = "\xEF\xBF\xBD";

  EXPECT_FALSE(utf8::valid("a\xFF" "b"));
  EXPECT_EQ("a" + replacement + "b", utf8::sanitize("a\xFF" "b"));

  // A lone continuation byte.
  EXPECT_EQ(replacement + "x", utf8::sanitize("\x80x"));

  // Binary garbage is replaced byte by byte.
  EXPECT_EQ(replacement + replacement, utf8::sanitize("\xFE\xFE"));
}


TEST(Utf8Test, TruncatedSequence)
{
  const string replacement = "\xEF\xBF\xBD";

  // The first two bytes of a three byte sequence at the end of the
  // output, as left behind by a command killed mid write.
  const string truncated = "ok\xE6\x97";

  EXPECT_FALSE(utf8::valid(truncated));
  EXPECT_EQ("ok" + replacement + replacement, utf8::sanitize(truncated));
}


TEST(Utf8Test, OverlongAndSurrogatesAreRejected)
{
  // Overlong encoding of '/'.
  EXPECT_FALSE(utf8::valid("\xC0\xAF"));

  // Overlong three byte encoding.
  EXPECT_FALSE(utf8::valid("\xE0\x80\xAF"));

  // U+D800, a UTF-16 surrogate.
  EXPECT_FALSE(utf8::valid("\xED\xA0\x80"));

  // Beyond U+10FFFF.
  EXPECT_FALSE(utf8::valid("\xF4\x90\x80\x80"));

  EXPECT_TRUE(utf8::valid("\xF4\x8F\xBF\xBF"));
}

} // namespace tests {
} // namespace internal {
} // namespace jailer {
