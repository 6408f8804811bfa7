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


#include "common/utf8.hpp"

using std::string;

namespace jailer {
namespace internal {
namespace utf8 {

namespace {

constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";


// Returns the length of the well formed sequence at 'position', or 0
// if the sequence is ill formed. Follows table 3-7 of the Unicode
// standard, so overlong encodings and surrogates are rejected.
size_t sequence(const string& data, size_t position)
{
  const unsigned char lead = data[position];

  if (lead < 0x80) {
    return 1;
  }

  size_t length = 0;
  unsigned char lower = 0x80;
  unsigned char upper = 0xBF;

  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead == 0xE0) {
    length = 3;
    lower = 0xA0;
  } else if (lead >= 0xE1 && lead <= 0xEC) {
    length = 3;
  } else if (lead == 0xED) {
    length = 3;
    upper = 0x9F;
  } else if (lead >= 0xEE && lead <= 0xEF) {
    length = 3;
  } else if (lead == 0xF0) {
    length = 4;
    lower = 0x90;
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    length = 4;
  } else if (lead == 0xF4) {
    length = 4;
    upper = 0x8F;
  } else {
    return 0;
  }

  if (position + length > data.size()) {
    return 0;
  }

  for (size_t i = 1; i < length; i++) {
    const unsigned char c = data[position + i];

    // Only the second byte has a restricted range.
    if (i == 1 ? (c < lower || c > upper) : (c < 0x80 || c > 0xBF)) {
      return 0;
    }
  }

  return length;
}

} // namespace {


bool valid(const string& data)
{
  size_t position = 0;
  while (position < data.size()) {
    const size_t length = sequence(data, position);
    if (length == 0) {
      return false;
    }
    position += length;
  }

  return true;
}


string sanitize(const string& data)
{
  if (valid(data)) {
    return data;
  }

  string result;
  result.reserve(data.size());

  size_t position = 0;
  while (position < data.size()) {
    const size_t length = sequence(data, position);
    if (length == 0) {
      result += REPLACEMENT_CHARACTER;
      position++;
    } else {
      result.append(data, position, length);
      position += length;
    }
  }

  return result;
}

} // namespace utf8 {
} // namespace internal {
} // namespace jailer {
