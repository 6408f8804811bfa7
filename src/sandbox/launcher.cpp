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


#include <array>
#include <string>

#include <process/clock.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/error.hpp>
#include <stout/os.hpp>
#include <stout/uuid.hpp>

#include <stout/os/close.hpp>
#include <stout/os/pipe.hpp>

#include <glog/logging.h>

#include "sandbox/isolation.hpp"
#include "sandbox/launcher.hpp"

using namespace process;

using std::array;
using std::string;

namespace jailer {
namespace internal {
namespace sandbox {

Try<ExecutionHandle> Launcher::launch(
    const ExecutionRequest& request,
    const ProfileInfo& profile) const
{
  Try<IsolationPolicy> policy =
    IsolationPolicy::create(request, profile, flags);

  if (policy.isError()) {
    return Error("Invalid isolation policy: " + policy.error());
  }

  // NOTE: The pipes are created manually instead of using
  // `Subprocess::PIPE` so that the streams can be read before the
  // status of the docker client is known.
  Try<array<int, 2>> outfds = os::pipe();
  if (outfds.isError()) {
    return Error("Failed to create stdout pipe: " + outfds.error());
  }

  Try<array<int, 2>> errfds = os::pipe();
  if (errfds.isError()) {
    os::close(outfds->at(0));
    os::close(outfds->at(1));
    return Error("Failed to create stderr pipe: " + errfds.error());
  }

  ExecutionHandle handle;
  handle.name = flags.container_prefix + id::UUID::random().toString();
  handle.started = Clock::now();

  // `io::read` duplicates the file descriptors, the originals are
  // closed right away.
  handle.out = io::read(outfds->at(0));
  handle.err = io::read(errfds->at(0));

  os::close(outfds->at(0));
  os::close(errfds->at(0));

  LOG(INFO) << "Launching container '" << handle.name << "' from image '"
            << policy->image << "' with network "
            << (policy->network ? "enabled" : "disabled");

  handle.status = docker->run(
      policy->runOptions(handle.name, request.command),
      Subprocess::FD(outfds->at(1)),
      Subprocess::FD(errfds->at(1)));

  // The docker client holds its own copies of the write ends, the
  // streams reach EOF once it and the container are gone.
  os::close(outfds->at(1));
  os::close(errfds->at(1));

  return handle;
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
