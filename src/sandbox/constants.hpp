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


#ifndef __SANDBOX_CONSTANTS_HPP__
#define __SANDBOX_CONSTANTS_HPP__

#include <string>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>

namespace jailer {
namespace internal {
namespace sandbox {

constexpr size_t DEFAULT_MAX_CONCURRENT_EXECUTIONS = 5;

// Default deadlines per profile.
constexpr Duration DEFAULT_MINIMAL_TIMEOUT = Seconds(60);
constexpr Duration DEFAULT_EXTENDED_TIMEOUT = Seconds(120);

constexpr Bytes DEFAULT_MEMORY_LIMIT = Megabytes(256);
constexpr double DEFAULT_CPUS_LIMIT = 0.5;
constexpr int DEFAULT_PIDS_LIMIT = 100;

// Sizes of the writable tmpfs mounts.
constexpr Bytes DEFAULT_TMP_SIZE = Megabytes(64);
constexpr Bytes DEFAULT_WORKDIR_SIZE = Megabytes(32);

// How long the docker client is given to exit after the container
// has been killed before the client itself is killed.
constexpr Duration DEFAULT_KILL_GRACE_PERIOD = Seconds(5);

// Upper bound for the runtime availability check.
constexpr Duration DEFAULT_AVAILABILITY_TIMEOUT = Seconds(10);

// Exit status docker uses when the error is with the daemon itself.
constexpr int DOCKER_DAEMON_ERROR_EXIT_CODE = 125;

const std::string DEFAULT_MINIMAL_IMAGE = "alpine:latest";
const std::string DEFAULT_EXTENDED_IMAGE = "blackarchlinux/blackarch:latest";

const std::string DEFAULT_USER = "1000:1000";
const std::string DEFAULT_WORKING_DIR = "/workspace";
const std::string DEFAULT_CONTAINER_PREFIX = "jailer-";

// Every container is started with this shell.
const std::string SHELL_PATH = "/bin/sh";

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_CONSTANTS_HPP__
