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


#ifndef __JAILER_JAILER_HPP__
#define __JAILER_JAILER_HPP__

#include <ostream>
#include <string>

#include <stout/duration.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>

namespace jailer {

// Named execution environments. Each profile maps to an image, a
// "network trusted" bit and a default timeout, see
// 'sandbox/profile.hpp'.
enum class Profile
{
  MINIMAL,
  EXTENDED
};


// A single command to run inside a fresh container.
struct ExecutionRequest
{
  explicit ExecutionRequest(
      const std::string& _command,
      Profile _profile = Profile::MINIMAL,
      bool _networkEnabled = false,
      const Option<Duration>& _timeout = None(),
      const Option<std::string>& _workingDirectory = None())
    : command(_command),
      profile(_profile),
      networkEnabled(_networkEnabled),
      timeout(_timeout),
      workingDirectory(_workingDirectory) {}

  std::string command;
  Profile profile;

  // Only honored for network trusted profiles.
  bool networkEnabled;

  // Falls back to the profile's default timeout when not set.
  Option<Duration> timeout;

  // Falls back to the configured '--working_dir' when not set.
  Option<std::string> workingDirectory;
};


struct ExecutionResult
{
  enum State
  {
    COMPLETED,
    TIMED_OUT,
    LAUNCH_FAILED
  };

  State state;

  // Captured output, with invalid UTF-8 sequences replaced.
  std::string out;
  std::string err;

  // Exit code of the command, or -1 if the command did not exit
  // normally (timeout, launch failure, killed by a signal).
  int exitCode;

  Duration elapsed;

  bool timedOut;

  Option<std::string> error;
};


std::ostream& operator<<(std::ostream& stream, const Profile& profile);


std::ostream& operator<<(
    std::ostream& stream,
    const ExecutionResult::State& state);

} // namespace jailer {

#endif // __JAILER_JAILER_HPP__
