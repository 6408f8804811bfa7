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


#ifndef __TESTS_MOCKDOCKER_HPP__
#define __TESTS_MOCKDOCKER_HPP__

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <process/future.hpp>
#include <process/subprocess.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "docker/docker.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace jailer {
namespace internal {
namespace tests {

// Definition of a mock Docker to be used in tests with gmock.
//
// By default no daemon is involved: 'run' starts the arguments of the
// container (i.e., '/bin/sh -c <command>') as a local process in its
// own session, 'kill' signals that session and 'ps' lists the local
// "containers" still running. 'info', 'pull' and 'rm' succeed.
class MockDocker : public Docker
{
public:
  MockDocker(
      const std::string& path = "docker",
      const std::string& socket = "/var/run/docker.sock");
  ~MockDocker() override;

  MOCK_CONST_METHOD3(
      run,
      process::Future<Option<int>>(
          const Docker::RunOptions& options,
          const process::Subprocess::IO&,
          const process::Subprocess::IO&));

  MOCK_CONST_METHOD0(
      info,
      process::Future<Nothing>());

  MOCK_CONST_METHOD2(
      kill,
      process::Future<Nothing>(const std::string&, int));

  MOCK_CONST_METHOD2(
      rm,
      process::Future<Nothing>(const std::string&, bool));

  MOCK_CONST_METHOD2(
      ps,
      process::Future<std::vector<std::string>>(
          bool, const Option<std::string>&));

  MOCK_CONST_METHOD2(
      pull,
      process::Future<Nothing>(const std::string&, bool));

  process::Future<Option<int>> _run(
      const Docker::RunOptions& options,
      const process::Subprocess::IO& _stdout,
      const process::Subprocess::IO& _stderr) const;

  process::Future<Nothing> _kill(
      const std::string& containerName,
      int signal) const;

  process::Future<std::vector<std::string>> _ps(
      bool all,
      const Option<std::string>& prefix) const;

private:
  // Shared with the callbacks of the local processes, which may
  // outlive the mock.
  struct Containers
  {
    std::mutex mutex;
    hashmap<std::string, pid_t> pids;
  };

  std::shared_ptr<Containers> containers;
};

} // namespace tests {
} // namespace internal {
} // namespace jailer {

#endif // __TESTS_MOCKDOCKER_HPP__
