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


#ifndef __COMMON_UTF8_HPP__
#define __COMMON_UTF8_HPP__

#include <string>

namespace jailer {
namespace internal {
namespace utf8 {

// Returns whether 'data' is well formed UTF-8.
bool valid(const std::string& data);


// Decodes 'data' lossily: every ill formed sequence is replaced with
// U+FFFD, well formed input is returned unchanged.
std::string sanitize(const std::string& data);

} // namespace utf8 {
} // namespace internal {
} // namespace jailer {

#endif // __COMMON_UTF8_HPP__
