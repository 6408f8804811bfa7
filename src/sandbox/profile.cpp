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

#include <stout/error.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>

#include "sandbox/profile.hpp"

using std::string;

namespace jailer {
namespace internal {
namespace sandbox {

ProfileInfo describe(Profile profile, const Flags& flags)
{
  ProfileInfo info;

  switch (profile) {
    case Profile::MINIMAL:
      info.image = flags.minimal_image;
      info.networkTrusted = false;
      info.defaultTimeout = flags.minimal_timeout;
      return info;
    case Profile::EXTENDED:
      info.image = flags.extended_image;
      info.networkTrusted = true;
      info.defaultTimeout = flags.extended_timeout;
      return info;
  }

  UNREACHABLE();
}


Try<Profile> parseProfile(const string& value)
{
  const string name = strings::lower(strings::trim(value));

  if (name == "minimal") {
    return Profile::MINIMAL;
  } else if (name == "extended") {
    return Profile::EXTENDED;
  }

  return Error("Unknown profile '" + value + "'");
}


bool networkAllowed(const ProfileInfo& profile, bool requested)
{
  return profile.networkTrusted && requested;
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
