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
#include <vector>

#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <process/metrics/counter.hpp>
#include <process/metrics/metrics.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/uuid.hpp>

#include <glog/logging.h>

#include "sandbox/admission.hpp"
#include "sandbox/launcher.hpp"
#include "sandbox/profile.hpp"
#include "sandbox/registry.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/supervisor.hpp"

using namespace process;

using process::metrics::Counter;

using std::string;
using std::vector;

namespace jailer {
namespace internal {
namespace sandbox {

class SandboxProcess : public Process<SandboxProcess>
{
public:
  SandboxProcess(const Flags& _flags, const Shared<Docker>& _docker)
    : ProcessBase(ID::generate("sandbox")),
      flags(instance(_flags)),
      docker(_docker),
      admission(flags.max_concurrent_executions),
      launcher(_docker, flags),
      supervisor(_docker, flags.kill_grace_period),
      registry(_docker, flags) {}

  Future<ExecutionResult> execute(const ExecutionRequest& request);

  Future<vector<string>> prewarm();

  Future<bool> available();

  Future<AdmissionController::Usage> usage();

protected:
  void initialize() override;

private:
  // Narrows the container prefix down to this instance, so that the
  // sweep of one sandbox never sees the containers of another.
  static Flags instance(const Flags& flags)
  {
    Flags result = flags;
    result.container_prefix += id::UUID::random().toString() + "-";
    return result;
  }

  Future<ExecutionResult> _execute(
      const ExecutionRequest& request,
      const Permit& permit);

  void __execute(
      const Option<string>& name,
      const Permit& permit,
      const Future<ExecutionResult>& result);

  void sweep();

  void _sweep(const Future<vector<string>>& containers);

  const Flags flags;
  const Shared<Docker> docker;

  AdmissionController admission;
  Launcher launcher;
  Supervisor supervisor;
  ImageRegistry registry;

  // Names of the containers of the executions in flight.
  hashset<string> running;

  struct Metrics
  {
    Metrics();
    ~Metrics();

    Counter executions_completed;
    Counter executions_timed_out;
    Counter executions_launch_failed;
  } metrics;
};


SandboxProcess::Metrics::Metrics()
  : executions_completed("sandbox/executions_completed"),
    executions_timed_out("sandbox/executions_timed_out"),
    executions_launch_failed("sandbox/executions_launch_failed")
{
  process::metrics::add(executions_completed);
  process::metrics::add(executions_timed_out);
  process::metrics::add(executions_launch_failed);
}


SandboxProcess::Metrics::~Metrics()
{
  process::metrics::remove(executions_completed);
  process::metrics::remove(executions_timed_out);
  process::metrics::remove(executions_launch_failed);
}


void SandboxProcess::initialize()
{
  if (flags.orphan_sweep_interval.isSome()) {
    LOG(INFO) << "Sweeping orphaned containers with prefix '"
              << flags.container_prefix << "' every "
              << flags.orphan_sweep_interval.get();

    delay(flags.orphan_sweep_interval.get(), self(), &Self::sweep);
  }
}


Future<ExecutionResult> SandboxProcess::execute(
    const ExecutionRequest& request)
{
  if (strings::trim(request.command).empty()) {
    return Failure("Command must not be empty");
  }

  if (request.timeout.isSome() && request.timeout.get() <= Duration::zero()) {
    return Failure(
        "Timeout must be positive, got " + stringify(request.timeout.get()));
  }

  if (request.workingDirectory.isSome()) {
    Option<Error> error =
      validateWorkingDirectory(request.workingDirectory.get());

    if (error.isSome()) {
      return Failure("Invalid working directory: " + error->message);
    }
  }

  // Only the deadline cancels an execution, a caller discarding the
  // result must not leave a container behind without its permit.
  return undiscardable(admission.acquire()
    .then(defer(self(), &Self::_execute, request, lambda::_1)));
}


Future<ExecutionResult> SandboxProcess::_execute(
    const ExecutionRequest& request,
    const Permit& permit)
{
  const ProfileInfo profile = describe(request.profile, flags);
  const Duration timeout = request.timeout.getOrElse(profile.defaultTimeout);

  VLOG(1) << "Acquired permit " << permit << " for '" << request.command
          << "'";

  Try<ExecutionHandle> handle = launcher.launch(request, profile);

  if (handle.isError()) {
    LOG(WARNING) << "Failed to launch '" << request.command << "': "
                 << handle.error();

    ExecutionResult result;
    result.state = ExecutionResult::LAUNCH_FAILED;
    result.exitCode = -1;
    result.elapsed = Duration::zero();
    result.timedOut = false;
    result.error = handle.error();

    __execute(None(), permit, result);

    return result;
  }

  running.insert(handle->name);

  return supervisor.await(handle.get(), timeout)
    .onAny(defer(
        self(),
        &Self::__execute,
        Option<string>(handle->name),
        permit,
        lambda::_1));
}


void SandboxProcess::__execute(
    const Option<string>& name,
    const Permit& permit,
    const Future<ExecutionResult>& result)
{
  if (name.isSome()) {
    running.erase(name.get());
  }

  admission.release(permit);

  if (!result.isReady()) {
    LOG(ERROR) << "Failed to supervise container '"
               << name.getOrElse("<none>") << "': "
               << (result.isFailed() ? result.failure() : "discarded");
    return;
  }

  switch (result->state) {
    case ExecutionResult::COMPLETED:
      ++metrics.executions_completed;
      break;
    case ExecutionResult::TIMED_OUT:
      ++metrics.executions_timed_out;
      break;
    case ExecutionResult::LAUNCH_FAILED:
      ++metrics.executions_launch_failed;
      break;
  }
}


Future<vector<string>> SandboxProcess::prewarm()
{
  return registry.prewarm({Profile::MINIMAL, Profile::EXTENDED});
}


Future<bool> SandboxProcess::available()
{
  return registry.available();
}


Future<AdmissionController::Usage> SandboxProcess::usage()
{
  return admission.usage();
}


void SandboxProcess::sweep()
{
  docker->ps(true, flags.container_prefix)
    .onAny(defer(self(), &Self::_sweep, lambda::_1));
}


void SandboxProcess::_sweep(const Future<vector<string>>& containers)
{
  if (!containers.isReady()) {
    LOG(WARNING) << "Failed to list containers for the orphan sweep: "
                 << (containers.isFailed() ? containers.failure()
                                           : "discarded");
  } else {
    foreach (const string& name, containers.get()) {
      if (!strings::startsWith(name, flags.container_prefix) ||
          running.contains(name)) {
        continue;
      }

      LOG(INFO) << "Removing orphaned container '" << name << "'";

      docker->rm(name, true)
        .onFailed([name](const string& failure) {
          LOG(ERROR) << "Failed to remove orphaned container '" << name
                     << "': " << failure;
        });
    }
  }

  delay(flags.orphan_sweep_interval.get(), self(), &Self::sweep);
}


Try<Owned<Sandbox>> Sandbox::create(const Flags& flags)
{
  Try<Owned<Docker>> docker = Docker::create(
      flags.docker,
      flags.docker_socket,
      flags.validate_docker);

  if (docker.isError()) {
    return Error("Failed to create docker: " + docker.error());
  }

  return create(flags, docker->share());
}


Try<Owned<Sandbox>> Sandbox::create(
    const Flags& flags,
    const Shared<Docker>& docker)
{
  Option<Error> error = validate(flags);
  if (error.isSome()) {
    return Error("Invalid flags: " + error->message);
  }

  return Owned<Sandbox>(new Sandbox(new SandboxProcess(flags, docker)));
}


Sandbox::Sandbox(SandboxProcess* _process)
  : process(_process)
{
  spawn(process);
}


Sandbox::~Sandbox()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<ExecutionResult> Sandbox::execute(const ExecutionRequest& request)
{
  return dispatch(process, &SandboxProcess::execute, request);
}


Future<ExecutionResult> Sandbox::execute(
    const string& command,
    Profile profile,
    bool networkEnabled,
    const Option<Duration>& timeout)
{
  return execute(ExecutionRequest(command, profile, networkEnabled, timeout));
}


Future<vector<string>> Sandbox::prewarmImages()
{
  return dispatch(process, &SandboxProcess::prewarm);
}


Future<bool> Sandbox::runtimeAvailable()
{
  return dispatch(process, &SandboxProcess::available);
}


Future<AdmissionController::Usage> Sandbox::usage()
{
  return dispatch(process, &SandboxProcess::usage);
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
