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


#ifndef __SANDBOX_ISOLATION_HPP__
#define __SANDBOX_ISOLATION_HPP__

#include <string>

#include <jailer/jailer.hpp>

#include <stout/bytes.hpp>
#include <stout/try.hpp>

#include "docker/docker.hpp"

#include "sandbox/flags.hpp"
#include "sandbox/profile.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// The restrictions applied to a single execution. Every container
// drops all capabilities, cannot gain privileges, has a read-only
// root filesystem and is removed once it exits.
struct IsolationPolicy
{
  // Derives the policy of 'request' under the resolved 'profile'.
  // Fails if the working directory is not an absolute, normalized
  // path.
  static Try<IsolationPolicy> create(
      const ExecutionRequest& request,
      const ProfileInfo& profile,
      const Flags& flags);

  // Translates the policy into the options of 'docker run' for a
  // container named 'name' that runs 'command' with '/bin/sh -c'.
  Docker::RunOptions runOptions(
      const std::string& name,
      const std::string& command) const;

  std::string image;
  std::string workingDirectory;
  bool network;

  Bytes memory;
  double cpus;
  int pids;
  Bytes tmpSize;
  Bytes workdirSize;
  std::string user;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_ISOLATION_HPP__
