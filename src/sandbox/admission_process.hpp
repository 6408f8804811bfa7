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


#ifndef __SANDBOX_ADMISSION_PROCESS_HPP__
#define __SANDBOX_ADMISSION_PROCESS_HPP__

#include <deque>

#include <process/future.hpp>
#include <process/id.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include <process/metrics/push_gauge.hpp>

#include <stout/hashset.hpp>
#include <stout/uuid.hpp>

#include "sandbox/admission.hpp"

namespace jailer {
namespace internal {
namespace sandbox {

class AdmissionControllerProcess :
    public process::Process<AdmissionControllerProcess>
{
public:
  explicit AdmissionControllerProcess(size_t _capacity)
    : ProcessBase(process::ID::generate("sandbox-admission")),
      capacity(_capacity),
      acquired(0),
      released(0) {}

  ~AdmissionControllerProcess() override;

  process::Future<Permit> acquire();

  void release(const Permit& permit);

  AdmissionController::Usage usage();

private:
  struct Waiter
  {
    Waiter() : id(id::UUID::random()) {}

    const id::UUID id;
    process::Promise<Permit> promise;
  };

  // Hands out a new permit, the caller makes sure one is available.
  Permit grant();

  // Removes a waiter whose caller discarded its future.
  void discarded(const id::UUID& waiter);

  void update();

  const size_t capacity;

  // Permits currently in flight.
  hashset<id::UUID> permits;

  std::deque<process::Owned<Waiter>> waiters;

  uint64_t acquired;
  uint64_t released;

  struct Metrics
  {
    Metrics();
    ~Metrics();

    process::metrics::PushGauge permits_in_flight;
    process::metrics::PushGauge permits_waiting;
  } metrics;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_ADMISSION_PROCESS_HPP__
