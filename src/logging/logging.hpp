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


#ifndef __LOGGING_LOGGING_HPP__
#define __LOGGING_LOGGING_HPP__

#include <string>

#include <glog/logging.h>

#include <stout/try.hpp>

#include "logging/flags.hpp"

namespace jailer {
namespace internal {
namespace logging {

// Sets up glog from the flags. Calls after the first are no-ops.
// With 'installFailureSignalHandler' crashes dump a stack trace while
// SIGTERM is logged and then terminates the process quietly.
void initialize(
    const std::string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler = false);


Try<google::LogSeverity> parseLogSeverity(const std::string& level);

} // namespace logging {
} // namespace internal {
} // namespace jailer {

#endif // __LOGGING_LOGGING_HPP__
