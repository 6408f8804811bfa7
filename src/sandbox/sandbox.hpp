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


#ifndef __SANDBOX_SANDBOX_HPP__
#define __SANDBOX_SANDBOX_HPP__

#include <string>
#include <vector>

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/duration.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "docker/docker.hpp"

#include "sandbox/admission.hpp"
#include "sandbox/flags.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// Forward declarations.
class SandboxProcess;


// Runs shell commands in fresh, resource bounded containers.
//
// Every accepted request yields exactly one 'ExecutionResult', also
// when the command times out or the container can not be started. The
// returned future only fails for malformed requests: an empty
// command, a non-positive timeout or a working directory that is not
// an absolute, normalized path.
class Sandbox
{
public:
  // Creates a sandbox that drives the docker CLI named by the flags.
  // Fails if the flags violate the isolation policy, see 'validate()'.
  // Containers are named '<container_prefix><instance>-<uuid>' with an
  // instance id that is unique to each sandbox.
  static Try<process::Owned<Sandbox>> create(const Flags& flags);

  static Try<process::Owned<Sandbox>> create(
      const Flags& flags,
      const process::Shared<Docker>& docker);

  ~Sandbox();

  process::Future<ExecutionResult> execute(const ExecutionRequest& request);

  process::Future<ExecutionResult> execute(
      const std::string& command,
      Profile profile = Profile::MINIMAL,
      bool networkEnabled = false,
      const Option<Duration>& timeout = None());

  // Starts pulling the images of all profiles. The returned future
  // need not be waited on and never fails.
  process::Future<std::vector<std::string>> prewarmImages();

  process::Future<bool> runtimeAvailable();

  process::Future<AdmissionController::Usage> usage();

private:
  explicit Sandbox(SandboxProcess* _process);

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  SandboxProcess* process;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_SANDBOX_HPP__
