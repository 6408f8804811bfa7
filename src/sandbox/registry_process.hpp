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


#ifndef __SANDBOX_REGISTRY_PROCESS_HPP__
#define __SANDBOX_REGISTRY_PROCESS_HPP__

#include <set>
#include <string>
#include <vector>

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/process.hpp>
#include <process/shared.hpp>

#include <stout/nothing.hpp>

#include "docker/docker.hpp"

#include "sandbox/flags.hpp"
#include "sandbox/registry.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

class ImageRegistryProcess : public process::Process<ImageRegistryProcess>
{
public:
  ImageRegistryProcess(
      const process::Shared<Docker>& _docker,
      const Flags& _flags);

  process::Future<std::vector<std::string>> prewarm(
      const std::vector<Profile>& profiles);

  process::Future<bool> available();

  std::set<std::string> prewarmed() { return images; }

private:
  process::Future<std::vector<std::string>> _prewarm(
      const std::vector<std::string>& images,
      bool available);

  std::vector<std::string> __prewarm(
      const std::vector<std::string>& images,
      const std::vector<process::Future<Nothing>>& pulls);

  const process::Shared<Docker> docker;
  const Flags flags;

  std::set<std::string> images;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_REGISTRY_PROCESS_HPP__
