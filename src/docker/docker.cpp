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
#include <vector>

#include <glog/logging.h>

#include <process/collect.hpp>
#include <process/io.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>
#include <stout/os/which.hpp>

#include "common/status_utils.hpp"

#include "docker/docker.hpp"

using namespace process;

using std::string;
using std::tuple;
using std::vector;

constexpr Duration DOCKER_VERSION_WAIT_TIMEOUT = Seconds(5);

// '--cpus' was added in 1.13.0.
static const Version MINIMUM_DOCKER_VERSION(1, 13, 0);


static void killClient(const Subprocess& s, const string& cmd)
{
  if (s.status().isPending()) {
    VLOG(1) << "Killing discarded '" << cmd << "'";
    os::kill(s.pid(), SIGKILL);
  }
}


// Maps a finished client to its stdout, or to a failure carrying its
// wait status and stderr.
static Future<string> result(
    const string& cmd,
    const tuple<Future<Option<int>>, Future<string>, Future<string>>& t)
{
  const Future<Option<int>>& status = std::get<0>(t);
  const Future<string>& out = std::get<1>(t);
  const Future<string>& err = std::get<2>(t);

  if (!status.isReady()) {
    return Failure(
        "Failed to reap '" + cmd + "': " +
        (status.isFailed() ? status.failure() : "discarded"));
  }

  if (status->isNone()) {
    return Failure("No exit status found for '" + cmd + "'");
  }

  if (status->get() != 0) {
    return Failure(
        "'" + cmd + "' " + WSTRINGIFY(status->get()) + "; stderr='" +
        strings::trim(err.isReady() ? err.get() : "") + "'");
  }

  if (!out.isReady()) {
    return Failure("Failed to read the output of '" + cmd + "'");
  }

  return out.get();
}


// Spawns a client with both output streams piped and reads them to
// EOF while waiting for its exit, so large output cannot block it.
static Future<string> spawn(
    const string& path,
    const vector<string>& argv,
    bool discardable)
{
  const string cmd = strings::join(" ", argv);

  VLOG(1) << "Running " << cmd;

  Try<Subprocess> s = subprocess(
      path,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE());

  if (s.isError()) {
    return Failure("Failed to create subprocess '" + cmd + "': " + s.error());
  }

  Future<string> output = process::await(
      s->status(),
      io::read(s->out().get()),
      io::read(s->err().get()))
    .then(lambda::bind(&result, cmd, lambda::_1));

  if (discardable) {
    output.onDiscard(lambda::bind(&killClient, s.get(), cmd));
  }

  return output;
}


Try<Owned<Docker>> Docker::create(
    const string& path,
    const string& socket,
    bool validate)
{
  if (!path::is_absolute(socket)) {
    return Error("Invalid Docker socket path: " + socket);
  }

  if (!path::is_absolute(path) && os::which(path).isNone()) {
    return Error("Failed to find the docker executable '" + path + "'");
  }

  Owned<Docker> docker(new Docker(path, socket));

  if (validate) {
    Try<Nothing> validated = docker->validateVersion(MINIMUM_DOCKER_VERSION);
    if (validated.isError()) {
      return Error(validated.error());
    }
  }

  return docker;
}


vector<string> Docker::command(const vector<string>& arguments) const
{
  vector<string> argv = {path, "-H", socket};
  argv.insert(argv.end(), arguments.begin(), arguments.end());
  return argv;
}


Future<Nothing> Docker::execute(const vector<string>& arguments) const
{
  return spawn(path, command(arguments), true)
    .then([]() { return Nothing(); });
}


Future<Version> Docker::version() const
{
  return spawn(path, command({"--version"}), true)
    .then(lambda::bind(&Docker::_version, lambda::_1));
}


Future<Version> Docker::_version(const string& output)
{
  // The output looks like "Docker version 20.10.7, build f0df350".
  vector<string> parts = strings::split(output, ",");
  vector<string> words = strings::tokenize(parts.front(), " ");

  if (words.empty()) {
    return Failure("Unable to find docker version in '" + output + "'");
  }

  // Some distributions append extra components to the version, e.g.
  // "1.13.1.fc22", which is not a semantic version.
  vector<string> components = strings::split(words.back(), ".");
  if (components.size() > 3) {
    components.resize(3);
  }

  Try<Version> version = Version::parse(strings::join(".", components));
  if (version.isError()) {
    return Failure("Failed to parse docker version: " + version.error());
  }

  return version.get();
}


Try<Nothing> Docker::validateVersion(const Version& minVersion) const
{
  Future<Version> version = this->version();

  if (!version.await(DOCKER_VERSION_WAIT_TIMEOUT)) {
    version.discard();
    return Error("Timed out getting docker version");
  }

  if (!version.isReady()) {
    return Error(
        "Failed to get docker version: " +
        (version.isFailed() ? version.failure() : "discarded"));
  }

  if (version.get() < minVersion) {
    return Error(
        "Insufficient version '" + stringify(version.get()) +
        "' of Docker, at least '" + stringify(minVersion) +
        "' is required");
  }

  return Nothing();
}


Future<Option<int>> Docker::run(
    const Docker::RunOptions& options,
    const process::Subprocess::IO& _stdout,
    const process::Subprocess::IO& _stderr) const
{
  if (options.image.empty()) {
    return Failure("No image specified for docker run");
  }

  vector<string> argv = command({"run"});

  if (options.remove) {
    argv.push_back("--rm");
  }

  if (options.name.isSome()) {
    argv.push_back("--name");
    argv.push_back(options.name.get());
  }

  foreach (const string& capability, options.capDrop) {
    argv.push_back("--cap-drop");
    argv.push_back(capability);
  }

  foreach (const string& option, options.securityOpt) {
    argv.push_back("--security-opt");
    argv.push_back(option);
  }

  if (options.readOnly) {
    argv.push_back("--read-only");
  }

  foreach (const string& mount, options.tmpfs) {
    if (!strings::startsWith(mount, "/")) {
      return Failure("Tmpfs mount '" + mount + "' is not an absolute path");
    }

    argv.push_back("--tmpfs");
    argv.push_back(mount);
  }

  if (options.memory.isSome()) {
    argv.push_back("--memory");
    argv.push_back(stringify(options.memory->bytes()));
  }

  if (options.cpus.isSome()) {
    argv.push_back("--cpus");
    argv.push_back(stringify(options.cpus.get()));
  }

  if (options.pidsLimit.isSome()) {
    argv.push_back("--pids-limit");
    argv.push_back(stringify(options.pidsLimit.get()));
  }

  if (options.user.isSome()) {
    argv.push_back("--user");
    argv.push_back(options.user.get());
  }

  if (options.workdir.isSome()) {
    argv.push_back("--workdir");
    argv.push_back(options.workdir.get());
  }

  if (options.network.isSome()) {
    argv.push_back("--network");
    argv.push_back(options.network.get());
  }

  argv.push_back(options.image);
  argv.insert(argv.end(), options.arguments.begin(), options.arguments.end());

  const string cmd = strings::join(" ", argv);

  VLOG(1) << "Running " << cmd;

  Try<Subprocess> s = subprocess(
      path,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      _stdout,
      _stderr);

  if (s.isError()) {
    return Failure("Failed to create subprocess '" + cmd + "': " + s.error());
  }

  s->status().onDiscard(lambda::bind(&killClient, s.get(), cmd));

  return s->status();
}


Future<Nothing> Docker::info() const
{
  return execute({"info"});
}


Future<Nothing> Docker::kill(const string& containerName, int signal) const
{
  return execute({"kill", "--signal=" + stringify(signal), containerName});
}


Future<Nothing> Docker::rm(const string& containerName, bool force) const
{
  // '-v' also removes the anonymous volumes of the container.
  if (force) {
    return execute({"rm", "-f", "-v", containerName});
  }

  return execute({"rm", "-v", containerName});
}


Future<vector<string>> Docker::ps(bool all, const Option<string>& prefix) const
{
  vector<string> arguments = {"ps"};

  if (all) {
    arguments.push_back("-a");
  }

  // NOTE: The 'name' filter matches substrings, the prefix itself is
  // enforced when parsing the output.
  if (prefix.isSome()) {
    arguments.push_back("--filter");
    arguments.push_back("name=" + prefix.get());
  }

  arguments.push_back("--format");
  arguments.push_back("{{.Names}}");

  return spawn(path, command(arguments), true)
    .then(lambda::bind(&Docker::_ps, prefix, lambda::_1));
}


vector<string> Docker::_ps(const Option<string>& prefix, const string& output)
{
  vector<string> names;

  foreach (const string& line, strings::tokenize(output, "\n")) {
    const string name = strings::trim(line);

    if (!name.empty() &&
        (prefix.isNone() || strings::startsWith(name, prefix.get()))) {
      names.push_back(name);
    }
  }

  return names;
}


Future<Nothing> Docker::pull(const string& image, bool force) const
{
  string reference = image;

  // Without a tag or digest docker would pull every tag of the
  // repository. The registry host may carry a port, so only the last
  // path component is checked.
  const string name = strings::split(image, "/").back();
  if (!strings::contains(name, ":") && !strings::contains(name, "@")) {
    reference += ":latest";
  }

  const vector<string> pull = command({"pull", reference});

  if (force) {
    return spawn(path, pull, true)
      .then([]() { return Nothing(); });
  }

  const string client = path;

  return spawn(client, command({"image", "inspect", reference}), false)
    .then([reference]() -> Future<Nothing> {
      VLOG(1) << "Image '" << reference << "' is already present";
      return Nothing();
    })
    .recover([client, pull](const Future<Nothing>&) -> Future<Nothing> {
      return spawn(client, pull, true)
        .then([]() { return Nothing(); });
    });
}
