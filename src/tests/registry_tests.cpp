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


#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <jailer/jailer.hpp>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/shared.hpp>

#include <stout/duration.hpp>
#include <stout/gtest.hpp>

#include "sandbox/flags.hpp"
#include "sandbox/registry.hpp"

#include "tests/mock_docker.hpp"

using jailer::internal::sandbox::Flags;
using jailer::internal::sandbox::ImageRegistry;

using process::Clock;
using process::Failure;
using process::Future;
using process::Promise;
using process::Shared;

using std::set;
using std::string;
using std::vector;

using testing::_;
using testing::Return;

namespace jailer {
namespace internal {
namespace tests {

class ImageRegistryTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    mockDocker = new MockDocker();
    docker = Shared<Docker>(mockDocker);
  }

  Flags flags;
  MockDocker* mockDocker;
  Shared<Docker> docker;
};


TEST_F(ImageRegistryTest, Prewarm)
{
  EXPECT_CALL(*mockDocker, pull("alpine:latest", false))
    .WillOnce(Return(Nothing()));

  EXPECT_CALL(*mockDocker, pull("blackarchlinux/blackarch:latest", false))
    .WillOnce(Return(Nothing()));

  ImageRegistry registry(docker, flags);

  Future<vector<string>> images =
    registry.prewarm({Profile::MINIMAL, Profile::EXTENDED});

  AWAIT_READY(images);
  EXPECT_EQ(
      vector<string>({"alpine:latest", "blackarchlinux/blackarch:latest"}),
      images.get());

  Future<set<string>> prewarmed = registry.prewarmed();
  AWAIT_READY(prewarmed);
  EXPECT_EQ(
      set<string>({"alpine:latest", "blackarchlinux/blackarch:latest"}),
      prewarmed.get());
}


// A failed pull is logged and leaves the other images alone.
TEST_F(ImageRegistryTest, PrewarmPullFailure)
{
  EXPECT_CALL(*mockDocker, pull("alpine:latest", false))
    .WillOnce(Return(Nothing()));

  EXPECT_CALL(*mockDocker, pull("blackarchlinux/blackarch:latest", false))
    .WillOnce(Return(Failure("manifest unknown")));

  ImageRegistry registry(docker, flags);

  Future<vector<string>> images =
    registry.prewarm({Profile::MINIMAL, Profile::EXTENDED});

  AWAIT_READY(images);
  EXPECT_EQ(vector<string>({"alpine:latest"}), images.get());

  Future<set<string>> prewarmed = registry.prewarmed();
  AWAIT_READY(prewarmed);
  EXPECT_EQ(set<string>({"alpine:latest"}), prewarmed.get());
}


// Profiles sharing an image pull it once.
TEST_F(ImageRegistryTest, PrewarmSharedImage)
{
  flags.extended_image = flags.minimal_image;

  EXPECT_CALL(*mockDocker, pull("alpine:latest", false))
    .WillOnce(Return(Nothing()));

  ImageRegistry registry(docker, flags);

  Future<vector<string>> images =
    registry.prewarm({Profile::MINIMAL, Profile::EXTENDED});

  AWAIT_READY(images);
  EXPECT_EQ(vector<string>({"alpine:latest"}), images.get());
}


TEST_F(ImageRegistryTest, PrewarmRuntimeUnavailable)
{
  EXPECT_CALL(*mockDocker, info())
    .WillOnce(Return(Failure("Cannot connect to the Docker daemon")));

  EXPECT_CALL(*mockDocker, pull(_, _))
    .Times(0);

  ImageRegistry registry(docker, flags);

  Future<vector<string>> images =
    registry.prewarm({Profile::MINIMAL, Profile::EXTENDED});

  AWAIT_READY(images);
  EXPECT_TRUE(images->empty());

  Future<set<string>> prewarmed = registry.prewarmed();
  AWAIT_READY(prewarmed);
  EXPECT_TRUE(prewarmed->empty());
}


TEST_F(ImageRegistryTest, Available)
{
  ImageRegistry registry(docker, flags);

  AWAIT_EXPECT_TRUE(registry.available());

  EXPECT_CALL(*mockDocker, info())
    .WillOnce(Return(Failure("Cannot connect to the Docker daemon")));

  AWAIT_EXPECT_FALSE(registry.available());
}


// An availability check that hangs is discarded once '--availability_timeout' expires.
TEST_F(ImageRegistryTest, AvailableTimeout)
{
  Promise<Nothing> info;

  EXPECT_CALL(*mockDocker, info())
    .WillOnce(Return(info.future()));

  ImageRegistry registry(docker, flags);

  Clock::pause();

  Future<bool> available = registry.available();

  // Make sure the check and its timer are in place.
  Clock::settle();

  Clock::advance(flags.availability_timeout);

  AWAIT_EXPECT_FALSE(available);
  EXPECT_TRUE(info.future().hasDiscard());

  Clock::resume();
}


TEST_F(ImageRegistryTest, NonCopyable)
{
  EXPECT_FALSE(std::is_copy_constructible<ImageRegistry>::value);
  EXPECT_FALSE(std::is_copy_assignable<ImageRegistry>::value);
}

} // namespace tests {
} // namespace internal {
} // namespace jailer {
