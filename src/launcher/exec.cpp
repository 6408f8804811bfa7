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


#include <iostream>
#include <string>
#include <vector>

#include <jailer/jailer.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/duration.hpp>
#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "sandbox/flags.hpp"
#include "sandbox/profile.hpp"
#include "sandbox/sandbox.hpp"

using namespace jailer;

using jailer::internal::sandbox::Sandbox;
using jailer::internal::sandbox::parseProfile;

using process::Future;
using process::Owned;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;

// Exit statuses that mirror those of 'timeout(1)' and 'docker run'.
constexpr int TIMED_OUT_EXIT_STATUS = 124;
constexpr int LAUNCH_FAILED_EXIT_STATUS = 125;


class Flags : public virtual jailer::internal::sandbox::Flags
{
public:
  Flags()
  {
    add(&Flags::command,
        "command",
        "The shell command to run, passed to '/bin/sh -c'.");

    add(&Flags::profile,
        "profile",
        "Execution environment, either 'minimal' or 'extended'.",
        "minimal");

    add(&Flags::network,
        "network",
        "Whether the command may use the network. Only honored by\n"
        "the 'extended' profile.",
        false);

    add(&Flags::timeout,
        "timeout",
        "Deadline of the command. Defaults to the timeout of the profile.");

    add(&Flags::prewarm,
        "prewarm",
        "Pull the images of all profiles before running the command.",
        false);

    add(&Flags::check_runtime,
        "check_runtime",
        "Only check whether the container runtime is reachable. Exits\n"
        "with 0 if it is and 1 otherwise.",
        false);
  }

  Option<string> command;
  string profile;
  bool network;
  Option<Duration> timeout;
  bool prewarm;
  bool check_runtime;
};


int main(int argc, char** argv)
{
  Flags flags;

  // Load flags from environment and command line.
  Try<flags::Warnings> load = flags.load("JAILER_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  jailer::internal::logging::initialize(argv[0], flags, true);

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  VLOG(1) << stringify(flags);

  process::initialize();

  Try<Owned<Sandbox>> sandbox = Sandbox::create(flags);
  if (sandbox.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to create the sandbox: " << sandbox.error();
  }

  if (flags.check_runtime) {
    Future<bool> available = sandbox.get()->runtimeAvailable();
    available.await();

    const bool reachable = available.isReady() && available.get();
    cout << "Container runtime is "
         << (reachable ? "available" : "unavailable") << endl;

    return reachable ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if (flags.command.isNone()) {
    EXIT(EXIT_FAILURE) << flags.usage("Missing required option --command");
  }

  Try<Profile> profile = parseProfile(flags.profile);
  if (profile.isError()) {
    EXIT(EXIT_FAILURE)
      << flags.usage("Failed to parse --profile: " + profile.error());
  }

  if (flags.prewarm) {
    Future<vector<string>> images = sandbox.get()->prewarmImages();
    images.await();

    if (images.isReady()) {
      LOG(INFO) << "Prewarmed images " << stringify(images.get());
    }
  } else {
    Future<bool> available = sandbox.get()->runtimeAvailable();
    available.await();

    if (!available.isReady() || !available.get()) {
      LOG(WARNING) << "Container runtime is unreachable, the command is "
                   << "likely to fail to launch";
    }
  }

  Future<ExecutionResult> result = sandbox.get()->execute(ExecutionRequest(
      flags.command.get(),
      profile.get(),
      flags.network,
      flags.timeout));

  result.await();

  if (!result.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to execute '" << flags.command.get() << "': "
      << (result.isFailed() ? result.failure() : "discarded");
  }

  cout << result->out << std::flush;
  cerr << result->err << std::flush;

  LOG(INFO) << "Command " << result->state << " with exit code "
            << result->exitCode << " after " << result->elapsed;

  switch (result->state) {
    case ExecutionResult::COMPLETED:
      if (result->error.isSome()) {
        LOG(WARNING) << result->error.get();
      }
      return result->exitCode >= 0 ? result->exitCode : EXIT_FAILURE;
    case ExecutionResult::TIMED_OUT:
      LOG(WARNING) << result->error.getOrElse("Command timed out");
      return TIMED_OUT_EXIT_STATUS;
    case ExecutionResult::LAUNCH_FAILED:
      LOG(ERROR) << result->error.getOrElse("Command failed to launch");
      return LAUNCH_FAILED_EXIT_STATUS;
  }

  return EXIT_FAILURE;
}
