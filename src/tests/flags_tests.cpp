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

#include <gtest/gtest.h>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/gtest.hpp>
#include <stout/none.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "sandbox/flags.hpp"

using std::string;

namespace jailer {
namespace internal {
namespace tests {

// Loads a single flag from a command line.
static Try<flags::Warnings> load(sandbox::Flags* flags, const string& flag)
{
  const char* argv[] = {"jailer", flag.c_str()};

  return flags->load(None(), 2, argv);
}


// Loads a single flag into fresh flags, so every failure is caused
// by that flag alone.
static Try<flags::Warnings> load(const string& flag)
{
  sandbox::Flags flags;
  return load(&flags, flag);
}


TEST(FlagsTest, Defaults)
{
  sandbox::Flags flags;

  EXPECT_EQ(5u, flags.max_concurrent_executions);
  EXPECT_EQ("alpine:latest", flags.minimal_image);
  EXPECT_EQ(Seconds(60), flags.minimal_timeout);
  EXPECT_EQ(Seconds(120), flags.extended_timeout);
  EXPECT_EQ(Megabytes(256), flags.memory_limit);
  EXPECT_EQ(100, flags.pids_limit);
  EXPECT_EQ("1000:1000", flags.user);
  EXPECT_EQ("/workspace", flags.working_dir);
  EXPECT_EQ("jailer-", flags.container_prefix);
  EXPECT_NONE(flags.orphan_sweep_interval);
  EXPECT_EQ("INFO", flags.logging_level);
}


TEST(FlagsTest, Load)
{
  sandbox::Flags flags;

  ASSERT_SOME(load(&flags, "--max_concurrent_executions=2"));
  ASSERT_SOME(load(&flags, "--extended_timeout=5mins"));
  ASSERT_SOME(load(&flags, "--workdir_size=16MB"));
  ASSERT_SOME(load(&flags, "--user=1001:1001"));
  ASSERT_SOME(load(&flags, "--orphan_sweep_interval=1mins"));

  EXPECT_EQ(2u, flags.max_concurrent_executions);
  EXPECT_EQ(Minutes(5), flags.extended_timeout);
  EXPECT_EQ(Megabytes(16), flags.workdir_size);
  EXPECT_EQ("1001:1001", flags.user);
  EXPECT_SOME_EQ(Minutes(1), flags.orphan_sweep_interval);
}


TEST(FlagsTest, Validation)
{
  EXPECT_ERROR(load("--max_concurrent_executions=0"));
  EXPECT_ERROR(load("--minimal_timeout=0secs"));
  EXPECT_ERROR(load("--cpus_limit=0"));
  EXPECT_ERROR(load("--pids_limit=-1"));
  EXPECT_ERROR(load("--working_dir=workspace"));
  EXPECT_ERROR(load("--container_prefix="));
  EXPECT_ERROR(load("--logging_level=DEBUG"));
  EXPECT_ERROR(load("--log_verbosity=-1"));

  // A tmpfs of size zero would not be limited at all.
  EXPECT_ERROR(load("--tmp_size=0B"));
  EXPECT_ERROR(load("--workdir_size=0B"));

  EXPECT_ERROR(load("--kill_grace_period=0secs"));
  EXPECT_ERROR(load("--availability_timeout=0secs"));
  EXPECT_ERROR(load("--orphan_sweep_interval=0secs"));
}


TEST(FlagsTest, WorkingDirectory)
{
  EXPECT_SOME(load("--working_dir=/scratch"));
  EXPECT_SOME(load("--working_dir=/home/user/scratch"));

  EXPECT_ERROR(load("--working_dir=/"));
  EXPECT_ERROR(load("--working_dir=/tmp/"));
  EXPECT_ERROR(load("--working_dir=//tmp"));
  EXPECT_ERROR(load("--working_dir=/workspace/../etc"));
  EXPECT_ERROR(load("--working_dir=/workspace/."));
  EXPECT_ERROR(load("--working_dir=/work:space"));
  EXPECT_ERROR(load("--working_dir=/work,exec"));
}


// Flags assembled in code never pass through the flag validators.
TEST(FlagsTest, Validate)
{
  EXPECT_NONE(sandbox::validate(sandbox::Flags()));

  {
    sandbox::Flags flags;
    flags.user = "0:0";
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.workdir_size = Bytes(0);
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.tmp_size = Bytes(0);
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.pids_limit = 0;
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.working_dir = "/workspace/../etc";
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.kill_grace_period = Duration::zero();
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.orphan_sweep_interval = Duration::zero();
    EXPECT_SOME(sandbox::validate(flags));
  }

  {
    sandbox::Flags flags;
    flags.orphan_sweep_interval = Seconds(30);
    EXPECT_NONE(sandbox::validate(flags));
  }
}


TEST(FlagsTest, NonRootUser)
{
  EXPECT_ERROR(load("--user=0:0"));
  EXPECT_ERROR(load("--user=1000:0"));
  EXPECT_ERROR(load("--user=root"));
  EXPECT_ERROR(load("--user=nobody:nogroup"));
  EXPECT_ERROR(load("--user=1000"));
}


TEST(FlagsTest, LogSeverity)
{
  EXPECT_SOME_EQ(google::INFO, logging::parseLogSeverity("INFO"));
  EXPECT_SOME_EQ(google::WARNING, logging::parseLogSeverity("WARNING"));
  EXPECT_SOME_EQ(google::ERROR, logging::parseLogSeverity("ERROR"));
  EXPECT_ERROR(logging::parseLogSeverity("info"));
}

} // namespace tests {
} // namespace internal {
} // namespace jailer {
