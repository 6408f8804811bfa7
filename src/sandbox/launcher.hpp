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


#ifndef __SANDBOX_LAUNCHER_HPP__
#define __SANDBOX_LAUNCHER_HPP__

#include <string>

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/shared.hpp>
#include <process/time.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include "docker/docker.hpp"

#include "sandbox/flags.hpp"
#include "sandbox/profile.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// A running container. The streams are read from the moment the
// container starts, so a chatty command never blocks on a full pipe.
struct ExecutionHandle
{
  // Unique name of the container, used to kill it.
  std::string name;

  // Wait status of the docker client, see 'Docker::run'. Discarding
  // it kills the docker client.
  process::Future<Option<int>> status;

  // Complete once the docker client and the container closed the
  // corresponding stream.
  process::Future<std::string> out;
  process::Future<std::string> err;

  process::Time started;
};


class Launcher
{
public:
  Launcher(const process::Shared<Docker>& _docker, const Flags& _flags)
    : docker(_docker),
      flags(_flags) {}

  // Starts 'request' in a new container. Fails if the isolation
  // policy can not be derived or the output pipes can not be set up.
  // Failures of the docker client itself surface through the
  // handle's 'status'.
  Try<ExecutionHandle> launch(
      const ExecutionRequest& request,
      const ProfileInfo& profile) const;

private:
  const process::Shared<Docker> docker;
  const Flags flags;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_LAUNCHER_HPP__
