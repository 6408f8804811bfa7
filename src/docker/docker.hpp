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


#ifndef __DOCKER_HPP__
#define __DOCKER_HPP__

#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/subprocess.hpp>

#include <stout/bytes.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>
#include <stout/version.hpp>

// Scheme of the daemon address passed via '-H'.
constexpr char DOCKER_HOST_SCHEME[] = "unix://";

// Client side of the Docker daemon, driven through the docker CLI.
// Every call spawns one docker client process. The methods are
// virtual so tests can stand in for the daemon.
class Docker
{
public:
  // Fails if the executable can not be found or the socket path is
  // not absolute. With 'validate' the client version is checked too.
  static Try<process::Owned<Docker>> create(
      const std::string& path,
      const std::string& socket,
      bool validate = true);

  virtual ~Docker() {}

  // Subset of the 'docker run' options, see
  // https://docs.docker.com/engine/reference/run.
  struct RunOptions
  {
    RunOptions()
      : remove(false),
        readOnly(false) {}

    bool remove;                          // --rm
    bool readOnly;                        // --read-only
    std::vector<std::string> capDrop;     // --cap-drop
    std::vector<std::string> securityOpt; // --security-opt
    std::vector<std::string> tmpfs;       // --tmpfs PATH[:OPTIONS]
    Option<Bytes> memory;                 // --memory
    Option<double> cpus;                  // --cpus
    Option<int> pidsLimit;                // --pids-limit
    Option<std::string> user;             // --user
    Option<std::string> workdir;          // --workdir
    Option<std::string> network;          // --network
    Option<std::string> name;             // --name

    std::string image;
    std::vector<std::string> arguments;
  };

  // Performs 'docker run' in the foreground and returns the wait
  // status of the client. The client exits with the status of the
  // contained command, or with
  //     125 if the error is with the Docker daemon itself,
  //     126 if the contained command cannot be invoked,
  //     127 if the contained command cannot be found.
  //
  // Discarding the returned future kills the client, not the
  // container.
  virtual process::Future<Option<int>> run(
      const RunOptions& options,
      const process::Subprocess::IO& _stdout =
        process::Subprocess::FD(STDOUT_FILENO),
      const process::Subprocess::IO& _stderr =
        process::Subprocess::FD(STDERR_FILENO)) const;

  virtual process::Future<Version> version() const;

  // Performs 'docker info', which fails unless the daemon answers.
  // Discarding the future kills the client.
  virtual process::Future<Nothing> info() const;

  virtual process::Future<Nothing> kill(
      const std::string& containerName,
      int signal) const;

  virtual process::Future<Nothing> rm(
      const std::string& containerName,
      bool force = false) const;

  // Returns the names of the listed containers, optionally only
  // those starting with 'prefix'.
  virtual process::Future<std::vector<std::string>> ps(
      bool all = false,
      const Option<std::string>& prefix = None()) const;

  // Makes sure the image is present locally. Without 'force' an
  // image that 'docker image inspect' finds is not pulled again.
  // Discarding the future kills a running pull.
  virtual process::Future<Nothing> pull(
      const std::string& image,
      bool force = false) const;

  virtual Try<Nothing> validateVersion(const Version& minVersion) const;

protected:
  Docker(const std::string& _path, const std::string& _socket)
    : path(_path),
      socket(DOCKER_HOST_SCHEME + _socket) {}

private:
  // Returns the client command line for the given arguments.
  std::vector<std::string> command(
      const std::vector<std::string>& arguments) const;

  // Runs a client command whose output is of no interest. Fails with
  // the stderr of the client on a non-zero exit status.
  process::Future<Nothing> execute(
      const std::vector<std::string>& arguments) const;

  static process::Future<Version> _version(const std::string& output);

  static std::vector<std::string> _ps(
      const Option<std::string>& prefix,
      const std::string& output);

  const std::string path;
  const std::string socket;
};

#endif // __DOCKER_HPP__
