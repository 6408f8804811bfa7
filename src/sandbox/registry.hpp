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


#ifndef __SANDBOX_REGISTRY_HPP__
#define __SANDBOX_REGISTRY_HPP__

#include <set>
#include <string>
#include <vector>

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <stout/duration.hpp>

#include "docker/docker.hpp"

#include "sandbox/flags.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

// Forward declarations.
class ImageRegistryProcess;


// Keeps the images of the profiles warm and tells whether the
// container runtime is reachable. Nothing here is required for an
// execution to succeed: the runtime pulls missing images lazily.
class ImageRegistry
{
public:
  ImageRegistry(const process::Shared<Docker>& docker, const Flags& flags);
  ~ImageRegistry();

  // Pulls the images of 'profiles' concurrently, unless the runtime is
  // unreachable. Returns the images that are present afterwards.
  // Never fails, failed pulls are logged.
  process::Future<std::vector<std::string>> prewarm(
      const std::vector<Profile>& profiles);

  // Checks the runtime with 'docker info'. Any failure, including a
  // check that takes longer than '--availability_timeout', yields false.
  process::Future<bool> available();

  // Images successfully prewarmed so far.
  process::Future<std::set<std::string>> prewarmed();

private:
  ImageRegistry(const ImageRegistry&) = delete;
  ImageRegistry& operator=(const ImageRegistry&) = delete;

  ImageRegistryProcess* process;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_REGISTRY_HPP__
