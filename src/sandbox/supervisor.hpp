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


#ifndef __SANDBOX_SUPERVISOR_HPP__
#define __SANDBOX_SUPERVISOR_HPP__

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <process/metrics/counter.hpp>

#include <stout/duration.hpp>

#include "docker/docker.hpp"

#include "sandbox/launcher.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// Races the completion of a container against its deadline and turns
// the outcome into an 'ExecutionResult'.
//
// A container that misses its deadline is killed with SIGKILL. The
// docker client then gets 'killGracePeriod' to exit before it is
// killed as well, so the caller always gets a result. A failed kill
// is logged and counted, it never becomes the error of the result.
class Supervisor
{
public:
  Supervisor(
      const process::Shared<Docker>& docker,
      const Duration& killGracePeriod);

  ~Supervisor();

  // The returned future is never failed.
  process::Future<ExecutionResult> await(
      const ExecutionHandle& handle,
      const Duration& timeout) const;

private:
  const process::Shared<Docker> docker;
  const Duration killGracePeriod;

  struct Metrics
  {
    Metrics();
    ~Metrics();

    process::metrics::Counter kill_failures;
  } metrics;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_SUPERVISOR_HPP__
