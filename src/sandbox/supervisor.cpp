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


#include <signal.h>

#include <string>
#include <tuple>

#include <process/clock.hpp>
#include <process/collect.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/lambda.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <glog/logging.h>

#include "common/status_utils.hpp"
#include "common/utf8.hpp"

#include "sandbox/constants.hpp"
#include "sandbox/supervisor.hpp"

using namespace process;

using process::metrics::Counter;

using std::string;
using std::tuple;

namespace jailer {
namespace internal {
namespace sandbox {

namespace {

// How a container ended, before its output is known.
struct Termination
{
  Termination(const Option<int>& _status, bool _timedOut)
    : status(_status),
      timedOut(_timedOut) {}

  Option<int> status;
  bool timedOut;
};


// Whether the docker client reported a failure of the runtime itself
// rather than an exit code of the command.
bool runtimeFailed(int status, const string& err)
{
  return WIFEXITED(status) &&
    WEXITSTATUS(status) == DOCKER_DAEMON_ERROR_EXIT_CODE &&
    (strings::startsWith(err, "docker: ") ||
     strings::contains(err, "\ndocker: "));
}


Future<Termination> expired(
    const Shared<Docker>& docker,
    const string& name,
    const Duration& timeout,
    const Duration& killGracePeriod,
    Counter killFailures,
    const Future<Option<int>>& status)
{
  LOG(WARNING) << "Container '" << name << "' did not finish within "
               << timeout << ", killing it";

  docker->kill(name, SIGKILL)
    .onFailed([=](const string& failure) mutable {
      LOG(ERROR) << "Failed to kill container '" << name << "': " << failure;
      ++killFailures;
    });

  return status
    .after(killGracePeriod, [=](Future<Option<int>> future) {
      LOG(WARNING) << "Docker client of container '" << name << "' did "
                   << "not exit within " << killGracePeriod
                   << " after the kill, killing the client";

      // Discarding the status kills the docker client.
      future.discard();
      return Future<Option<int>>(Option<int>::none());
    })
    .then([](const Option<int>&) {
      return Termination(None(), true);
    })
    .recover([](const Future<Termination>&) {
      return Future<Termination>(Termination(None(), true));
    });
}


ExecutionResult assemble(
    const string& name,
    const Time& started,
    const Duration& timeout,
    const tuple<Future<Termination>, Future<string>, Future<string>>& t)
{
  const Future<Termination>& termination = std::get<0>(t);
  const Future<string>& out = std::get<1>(t);
  const Future<string>& err = std::get<2>(t);

  ExecutionResult result;
  result.out = out.isReady() ? utf8::sanitize(out.get()) : "";
  result.err = err.isReady() ? utf8::sanitize(err.get()) : "";
  result.exitCode = -1;
  result.elapsed = Clock::now() - started;
  result.timedOut = false;

  if (!termination.isReady()) {
    result.state = ExecutionResult::LAUNCH_FAILED;
    result.error = "Failed to run container: " +
      (termination.isFailed() ? termination.failure() : "discarded");
  } else if (termination->timedOut) {
    result.state = ExecutionResult::TIMED_OUT;
    result.timedOut = true;
    result.error = "Command timed out after " + stringify(timeout);
  } else if (termination->status.isNone()) {
    result.state = ExecutionResult::LAUNCH_FAILED;
    result.error = "Failed to reap the docker client";
  } else if (runtimeFailed(termination->status.get(), result.err)) {
    result.state = ExecutionResult::LAUNCH_FAILED;
    result.error = strings::trim(result.err);
  } else {
    const int status = termination->status.get();

    result.state = ExecutionResult::COMPLETED;
    result.exitCode = WEXITCODE(status);

    if (!WIFEXITED(status)) {
      result.error = "Docker client " + WSTRINGIFY(status);
    }
  }

  if (result.state == ExecutionResult::LAUNCH_FAILED) {
    LOG(WARNING) << "Container '" << name << "' failed to launch: "
                 << result.error.get();
  } else {
    LOG(INFO) << "Container '" << name << "' " << result.state
              << " with exit code " << result.exitCode << " after "
              << result.elapsed;
  }

  return result;
}

} // namespace {


Supervisor::Metrics::Metrics()
  : kill_failures("sandbox/kill_failures")
{
  process::metrics::add(kill_failures);
}


Supervisor::Metrics::~Metrics()
{
  process::metrics::remove(kill_failures);
}


Supervisor::Supervisor(
    const Shared<Docker>& _docker,
    const Duration& _killGracePeriod)
  : docker(_docker),
    killGracePeriod(_killGracePeriod) {}


Supervisor::~Supervisor() {}


Future<ExecutionResult> Supervisor::await(
    const ExecutionHandle& handle,
    const Duration& timeout) const
{
  const Shared<Docker> docker = this->docker;
  const Duration killGracePeriod = this->killGracePeriod;
  const Counter killFailures = metrics.kill_failures;
  const string name = handle.name;
  const Future<Option<int>> status = handle.status;

  // Exactly one of the two branches completes 'termination'; the
  // deadline timer is cancelled when the status arrives first.
  Future<Termination> termination = status
    .then([](const Option<int>& status) {
      return Termination(status, false);
    })
    .after(timeout, [=](const Future<Termination>&) {
      return expired(
          docker, name, timeout, killGracePeriod, killFailures, status);
    });

  return process::await(termination, handle.out, handle.err)
    .then(lambda::bind(
        &assemble,
        handle.name,
        handle.started,
        timeout,
        lambda::_1));
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
