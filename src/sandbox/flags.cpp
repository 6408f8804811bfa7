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

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/flags.hpp"

using std::string;
using std::vector;

namespace jailer {
namespace internal {
namespace sandbox {

// Expects a numeric "UID:GID" pair that does not map to root.
static Option<Error> validateUser(const string& user)
{
  vector<string> ids = strings::split(user, ":");
  if (ids.size() != 2) {
    return Error("Expected '--user' in the form 'UID:GID'");
  }

  foreach (const string& id, ids) {
    Try<uint32_t> number = numify<uint32_t>(id);
    if (number.isError()) {
      return Error("Invalid numeric id '" + id + "' in '--user'");
    }

    if (number.get() == 0) {
      return Error("Executions must not run as root");
    }
  }

  return None();
}


Option<Error> validateWorkingDirectory(const string& directory)
{
  if (!path::is_absolute(directory)) {
    return Error("'" + directory + "' is not an absolute path");
  }

  if (directory == "/") {
    return Error("The root directory can not be the working directory");
  }

  // Docker separates the path and the options of a tmpfs mount with
  // ':' and the options with ','.
  if (directory.find_first_of(":,") != string::npos) {
    return Error("'" + directory + "' contains ':' or ','");
  }

  foreach (const string& component,
           strings::split(directory.substr(1), "/")) {
    if (component.empty() || component == "." || component == "..") {
      return Error("'" + directory + "' is not a normalized path");
    }
  }

  return None();
}


Option<Error> validate(const Flags& flags)
{
  if (flags.max_concurrent_executions == 0) {
    return Error("The maximum number of concurrent executions must be "
                 "positive");
  }

  if (flags.minimal_timeout <= Duration::zero() ||
      flags.extended_timeout <= Duration::zero()) {
    return Error("The profile timeouts must be positive");
  }

  if (flags.memory_limit == Bytes(0) ||
      flags.tmp_size == Bytes(0) ||
      flags.workdir_size == Bytes(0)) {
    return Error("The memory limit and the tmpfs sizes must be positive");
  }

  if (flags.cpus_limit <= 0.0 || flags.pids_limit <= 0) {
    return Error("The cpus and pids limits must be positive");
  }

  Option<Error> user = validateUser(flags.user);
  if (user.isSome()) {
    return user;
  }

  Option<Error> workingDirectory = validateWorkingDirectory(flags.working_dir);
  if (workingDirectory.isSome()) {
    return Error("Invalid working directory: " + workingDirectory->message);
  }

  if (flags.container_prefix.empty()) {
    return Error("The container prefix must not be empty");
  }

  if (flags.kill_grace_period <= Duration::zero() ||
      flags.availability_timeout <= Duration::zero()) {
    return Error("The kill grace period and the availability timeout must "
                 "be positive");
  }

  if (flags.orphan_sweep_interval.isSome() &&
      flags.orphan_sweep_interval.get() <= Duration::zero()) {
    return Error("The orphan sweep interval must be positive");
  }

  return None();
}


Flags::Flags()
{
  add(&Flags::docker,
      "docker",
      "The absolute path to the docker executable, or a name that is\n"
      "looked up in the PATH.",
      "docker");

  add(&Flags::docker_socket,
      "docker_socket",
      "The UNIX socket path used to reach the Docker daemon.",
      "/var/run/docker.sock");

  add(&Flags::validate_docker,
      "validate_docker",
      "Whether to check the docker version on start up. When enabled\n"
      "start up fails unless the daemon answers and runs at least 1.13.0.",
      false);

  add(&Flags::max_concurrent_executions,
      "max_concurrent_executions",
      "Maximum number of executions that are allowed to run at the same\n"
      "time. Further executions wait for a running one to finish.",
      DEFAULT_MAX_CONCURRENT_EXECUTIONS,
      [](const size_t& value) -> Option<Error> {
        if (value == 0) {
          return Error(
              "Expected `--max_concurrent_executions` to be positive");
        }
        return None();
      });

  add(&Flags::minimal_image,
      "minimal_image",
      "Image used for the 'minimal' profile (no network, small toolset).",
      DEFAULT_MINIMAL_IMAGE);

  add(&Flags::extended_image,
      "extended_image",
      "Image used for the 'extended' profile (network allowed,\n"
      "larger toolset).",
      DEFAULT_EXTENDED_IMAGE);

  add(&Flags::minimal_timeout,
      "minimal_timeout",
      "Default deadline of an execution under the 'minimal' profile.",
      DEFAULT_MINIMAL_TIMEOUT,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected `--minimal_timeout` to be positive");
        }
        return None();
      });

  add(&Flags::extended_timeout,
      "extended_timeout",
      "Default deadline of an execution under the 'extended' profile.",
      DEFAULT_EXTENDED_TIMEOUT,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected `--extended_timeout` to be positive");
        }
        return None();
      });

  add(&Flags::memory_limit,
      "memory_limit",
      "Memory ceiling of every container.",
      DEFAULT_MEMORY_LIMIT,
      [](const Bytes& value) -> Option<Error> {
        if (value == Bytes(0)) {
          return Error("Expected `--memory_limit` to be positive");
        }
        return None();
      });

  add(&Flags::cpus_limit,
      "cpus_limit",
      "CPU ceiling of every container, in cores.",
      DEFAULT_CPUS_LIMIT,
      [](const double& value) -> Option<Error> {
        if (value <= 0.0) {
          return Error("Expected `--cpus_limit` to be positive");
        }
        return None();
      });

  add(&Flags::pids_limit,
      "pids_limit",
      "Maximum number of processes inside every container.",
      DEFAULT_PIDS_LIMIT,
      [](const int& value) -> Option<Error> {
        if (value <= 0) {
          return Error("Expected `--pids_limit` to be positive");
        }
        return None();
      });

  add(&Flags::tmp_size,
      "tmp_size",
      "Size of the writable tmpfs mounted at '/tmp'.",
      DEFAULT_TMP_SIZE,
      [](const Bytes& value) -> Option<Error> {
        if (value == Bytes(0)) {
          return Error("Expected `--tmp_size` to be positive");
        }
        return None();
      });

  add(&Flags::workdir_size,
      "workdir_size",
      "Size of the writable tmpfs mounted at the working directory.",
      DEFAULT_WORKDIR_SIZE,
      [](const Bytes& value) -> Option<Error> {
        if (value == Bytes(0)) {
          return Error("Expected `--workdir_size` to be positive");
        }
        return None();
      });

  add(&Flags::user,
      "user",
      "Numeric 'UID:GID' every command runs as. Must not be root.",
      DEFAULT_USER,
      [](const string& value) -> Option<Error> {
        return validateUser(value);
      });

  add(&Flags::working_dir,
      "working_dir",
      "Default working directory inside the container.",
      DEFAULT_WORKING_DIR,
      [](const string& value) -> Option<Error> {
        Option<Error> error = validateWorkingDirectory(value);
        if (error.isSome()) {
          return Error("Invalid `--working_dir`: " + error->message);
        }
        return None();
      });

  add(&Flags::container_prefix,
      "container_prefix",
      "Prefix of the name of every container started by this process.\n"
      "The orphan sweep only considers containers with this prefix.",
      DEFAULT_CONTAINER_PREFIX,
      [](const string& value) -> Option<Error> {
        if (value.empty()) {
          return Error("Expected `--container_prefix` to be non-empty");
        }
        return None();
      });

  add(&Flags::kill_grace_period,
      "kill_grace_period",
      "How long to wait for the docker client to exit after a timed out\n"
      "container was killed. The client is killed once it expires.",
      DEFAULT_KILL_GRACE_PERIOD,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected `--kill_grace_period` to be positive");
        }
        return None();
      });

  add(&Flags::availability_timeout,
      "availability_timeout",
      "Upper bound for the container runtime availability check.",
      DEFAULT_AVAILABILITY_TIMEOUT,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected `--availability_timeout` to be positive");
        }
        return None();
      });

  add(&Flags::orphan_sweep_interval,
      "orphan_sweep_interval",
      "If set, containers started by this sandbox that do not belong\n"
      "to a running execution are force removed at this interval. This\n"
      "reclaims containers that survived a failed kill.",
      [](const Option<Duration>& value) -> Option<Error> {
        if (value.isSome() && value.get() <= Duration::zero()) {
          return Error("Expected `--orphan_sweep_interval` to be positive");
        }
        return None();
      });
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
