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

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/isolation.hpp"

using std::string;

namespace jailer {
namespace internal {
namespace sandbox {

static string tmpfs(const string& path, const Bytes& size)
{
  return path + ":rw,noexec,nosuid,size=" + stringify(size.bytes());
}


Try<IsolationPolicy> IsolationPolicy::create(
    const ExecutionRequest& request,
    const ProfileInfo& profile,
    const Flags& flags)
{
  const string workingDirectory =
    request.workingDirectory.getOrElse(flags.working_dir);

  Option<Error> error = validateWorkingDirectory(workingDirectory);
  if (error.isSome()) {
    return Error("Invalid working directory: " + error->message);
  }

  if (request.networkEnabled && !profile.networkTrusted) {
    LOG(WARNING) << "Network access was requested under the untrusted "
                 << request.profile << " profile, keeping it disabled";
  }

  IsolationPolicy policy;
  policy.image = profile.image;
  policy.workingDirectory = workingDirectory;
  policy.network = networkAllowed(profile, request.networkEnabled);
  policy.memory = flags.memory_limit;
  policy.cpus = flags.cpus_limit;
  policy.pids = flags.pids_limit;
  policy.tmpSize = flags.tmp_size;
  policy.workdirSize = flags.workdir_size;
  policy.user = flags.user;

  return policy;
}


Docker::RunOptions IsolationPolicy::runOptions(
    const string& name,
    const string& command) const
{
  Docker::RunOptions options;

  options.remove = true;
  options.name = name;
  options.capDrop.push_back("ALL");
  options.securityOpt.push_back("no-new-privileges");
  options.readOnly = true;

  options.tmpfs.push_back(tmpfs("/tmp", tmpSize));

  // The root filesystem is read-only, the working directory is the
  // only other writable location.
  if (workingDirectory != "/tmp") {
    options.tmpfs.push_back(tmpfs(workingDirectory, workdirSize));
  }

  options.memory = memory;
  options.cpus = cpus;
  options.pidsLimit = pids;
  options.user = user;
  options.workdir = workingDirectory;

  // The default bridge network is only attached on request.
  if (!network) {
    options.network = "none";
  }

  options.image = image;
  options.arguments.push_back(SHELL_PATH);
  options.arguments.push_back("-c");
  options.arguments.push_back(command);

  return options;
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
