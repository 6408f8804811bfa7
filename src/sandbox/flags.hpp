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


#ifndef __SANDBOX_FLAGS_HPP__
#define __SANDBOX_FLAGS_HPP__

#include <string>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string docker;
  std::string docker_socket;
  bool validate_docker;

  size_t max_concurrent_executions;

  std::string minimal_image;
  std::string extended_image;
  Duration minimal_timeout;
  Duration extended_timeout;

  Bytes memory_limit;
  double cpus_limit;
  int pids_limit;
  Bytes tmp_size;
  Bytes workdir_size;
  std::string user;
  std::string working_dir;

  std::string container_prefix;
  Duration kill_grace_period;
  Duration availability_timeout;
  Option<Duration> orphan_sweep_interval;
};


// Checks every invariant the isolation policy relies on. The flag
// validators only run on 'load()', so flags assembled in code are
// checked again with this before a sandbox is created.
Option<Error> validate(const Flags& flags);


// A working directory must be an absolute, normalized path other than
// '/' that can be passed to '--tmpfs' as is.
Option<Error> validateWorkingDirectory(const std::string& directory);

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_FLAGS_HPP__
