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


#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

#include <glog/logging.h>

#include "sandbox/profile.hpp"
#include "sandbox/registry.hpp"
#include "sandbox/registry_process.hpp"

using namespace process;

using std::set;
using std::string;
using std::vector;

namespace jailer {
namespace internal {
namespace sandbox {

ImageRegistryProcess::ImageRegistryProcess(
    const Shared<Docker>& _docker,
    const Flags& _flags)
  : ProcessBase(ID::generate("sandbox-image-registry")),
    docker(_docker),
    flags(_flags) {}


Future<vector<string>> ImageRegistryProcess::prewarm(
    const vector<Profile>& profiles)
{
  vector<string> images;
  foreach (const Profile& profile, profiles) {
    const string image = describe(profile, flags).image;
    if (std::find(images.begin(), images.end(), image) == images.end()) {
      images.push_back(image);
    }
  }

  return available()
    .then(defer(self(), &Self::_prewarm, images, lambda::_1));
}


Future<vector<string>> ImageRegistryProcess::_prewarm(
    const vector<string>& images,
    bool available)
{
  if (!available) {
    LOG(WARNING) << "Container runtime is not available, "
                 << "skipping the pull of " << stringify(images);
    return vector<string>();
  }

  vector<Future<Nothing>> pulls;
  foreach (const string& image, images) {
    LOG(INFO) << "Pulling image '" << image << "'";
    pulls.push_back(docker->pull(image));
  }

  return await(pulls)
    .then(defer(self(), &Self::__prewarm, images, lambda::_1));
}


vector<string> ImageRegistryProcess::__prewarm(
    const vector<string>& images,
    const vector<Future<Nothing>>& pulls)
{
  CHECK_EQ(images.size(), pulls.size());

  vector<string> pulled;
  for (size_t i = 0; i < images.size(); i++) {
    if (pulls[i].isReady()) {
      LOG(INFO) << "Image '" << images[i] << "' is present";
      pulled.push_back(images[i]);
      this->images.insert(images[i]);
    } else {
      LOG(WARNING) << "Failed to pull image '" << images[i] << "': "
                   << (pulls[i].isFailed() ? pulls[i].failure() : "discarded");
    }
  }

  return pulled;
}


Future<bool> ImageRegistryProcess::available()
{
  const Duration timeout = flags.availability_timeout;

  return docker->info()
    .after(timeout, [timeout](Future<Nothing> info) {
      // Discarding the check kills the docker client.
      info.discard();
      return Future<Nothing>(
          Failure("Timed out after " + stringify(timeout)));
    })
    .then([]() {
      return true;
    })
    .recover([](const Future<bool>& check) -> Future<bool> {
      LOG(WARNING) << "Container runtime is not available: "
                   << (check.isFailed() ? check.failure() : "discarded");
      return false;
    });
}


ImageRegistry::ImageRegistry(
    const Shared<Docker>& docker,
    const Flags& flags)
{
  process = new ImageRegistryProcess(docker, flags);
  spawn(process);
}


ImageRegistry::~ImageRegistry()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<vector<string>> ImageRegistry::prewarm(const vector<Profile>& profiles)
{
  return dispatch(process, &ImageRegistryProcess::prewarm, profiles);
}


Future<bool> ImageRegistry::available()
{
  return dispatch(process, &ImageRegistryProcess::available);
}


Future<set<string>> ImageRegistry::prewarmed()
{
  return dispatch(process, &ImageRegistryProcess::prewarmed);
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
