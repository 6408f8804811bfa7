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


#include <signal.h>

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <iostream>
#include <string>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/exit.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::string;

namespace jailer {
namespace internal {
namespace logging {

// glog keeps a pointer to the program name.
static string* programName = nullptr;


// Only async signal safe logging (RAW_LOG) is allowed in here.
static void terminated(int signal, siginfo_t* siginfo, void*)
{
  if (siginfo->si_code == SI_USER || siginfo->si_code <= 0) {
    RAW_LOG(WARNING,
            "Received SIGTERM from process %d of user %d; exiting, "
            "running containers are left to the orphan sweep",
            siginfo->si_pid,
            siginfo->si_uid);
  } else {
    RAW_LOG(WARNING, "Received SIGTERM; exiting");
  }

  os::signals::reset(signal);
  raise(signal);
}


Try<google::LogSeverity> parseLogSeverity(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error("Unknown logging level '" + level + "'");
}


void initialize(
    const string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  Try<google::LogSeverity> severity = parseLogSeverity(flags.logging_level);
  if (severity.isError()) {
    EXIT(EXIT_FAILURE) << "Could not initialize logging: " << severity.error();
  }

  FLAGS_minloglevel = severity.get();
  FLAGS_v = flags.log_verbosity;

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      EXIT(EXIT_FAILURE)
        << "Could not initialize logging: Failed to create directory '"
        << flags.log_dir.get() << "': " << mkdir.error();
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    FLAGS_logtostderr = true;
  }

  if (flags.quiet) {
    FLAGS_stderrthreshold = google::FATAL;

    // The threshold does not apply when logging only to stderr.
    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = google::FATAL;
    }
  } else {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  }

  programName = new string(argv0);
  google::InitGoogleLogging(programName->c_str());

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();

    // A SIGTERM is a request to stop, not a crash.
    struct sigaction action;
    action.sa_sigaction = terminated;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;

    if (sigaction(SIGTERM, &action, nullptr) < 0) {
      PLOG(FATAL) << "Failed to set the SIGTERM handler";
    }
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace jailer {
