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


#ifndef __SANDBOX_PROFILE_HPP__
#define __SANDBOX_PROFILE_HPP__

#include <string>

#include <jailer/jailer.hpp>

#include <stout/duration.hpp>
#include <stout/try.hpp>

#include "sandbox/flags.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// What a profile resolves to under the current configuration.
struct ProfileInfo
{
  std::string image;

  // Whether executions under this profile may be attached to the
  // default network when they ask for it.
  bool networkTrusted;

  Duration defaultTimeout;
};


ProfileInfo describe(Profile profile, const Flags& flags);


// Parses "minimal" or "extended" (case insensitive).
Try<Profile> parseProfile(const std::string& value);


// Returns whether an execution under 'profile' gets network access,
// which requires both a trusted profile and an explicit request.
bool networkAllowed(const ProfileInfo& profile, bool requested);

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_PROFILE_HPP__
