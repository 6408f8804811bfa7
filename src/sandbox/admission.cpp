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


#include <process/defer.hpp>
#include <process/dispatch.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/foreach.hpp>

#include <glog/logging.h>

#include "sandbox/admission.hpp"
#include "sandbox/admission_process.hpp"

using namespace process;

namespace jailer {
namespace internal {
namespace sandbox {

std::ostream& operator<<(std::ostream& stream, const Permit& permit)
{
  return stream << permit.id;
}


AdmissionControllerProcess::Metrics::Metrics()
  : permits_in_flight("sandbox/permits_in_flight"),
    permits_waiting("sandbox/permits_waiting")
{
  process::metrics::add(permits_in_flight);
  process::metrics::add(permits_waiting);
}


AdmissionControllerProcess::Metrics::~Metrics()
{
  process::metrics::remove(permits_in_flight);
  process::metrics::remove(permits_waiting);
}


AdmissionControllerProcess::~AdmissionControllerProcess()
{
  foreach (const Owned<Waiter>& waiter, waiters) {
    waiter->promise.discard();
  }
}


Future<Permit> AdmissionControllerProcess::acquire()
{
  if (permits.size() < capacity && waiters.empty()) {
    return grant();
  }

  Owned<Waiter> waiter(new Waiter());
  waiters.push_back(waiter);

  VLOG(1) << "Queueing permit request " << waiter->id << " behind "
          << waiters.size() - 1 << " other request(s)";

  update();

  return waiter->promise.future()
    .onDiscard(defer(self(), &Self::discarded, waiter->id));
}


void AdmissionControllerProcess::release(const Permit& permit)
{
  if (!permits.contains(permit.id)) {
    LOG(ERROR) << "Ignoring release of unknown permit " << permit;
    return;
  }

  permits.erase(permit.id);
  released++;

  while (!waiters.empty() && permits.size() < capacity) {
    Owned<Waiter> waiter = waiters.front();
    waiters.pop_front();

    // The caller gave up before 'discarded' was dispatched to us.
    if (waiter->promise.future().hasDiscard()) {
      waiter->promise.discard();
      continue;
    }

    waiter->promise.set(grant());
  }

  update();
}


AdmissionController::Usage AdmissionControllerProcess::usage()
{
  AdmissionController::Usage usage;
  usage.inFlight = permits.size();
  usage.waiting = waiters.size();
  usage.acquired = acquired;
  usage.released = released;
  return usage;
}


Permit AdmissionControllerProcess::grant()
{
  CHECK_LT(permits.size(), capacity);

  Permit permit(id::UUID::random());

  permits.insert(permit.id);
  acquired++;

  update();

  return permit;
}


void AdmissionControllerProcess::discarded(const id::UUID& id)
{
  for (auto it = waiters.begin(); it != waiters.end(); ++it) {
    if ((*it)->id == id) {
      VLOG(1) << "Permit request " << id << " was discarded";
      (*it)->promise.discard();
      waiters.erase(it);
      break;
    }
  }

  update();
}


void AdmissionControllerProcess::update()
{
  metrics.permits_in_flight = static_cast<double>(permits.size());
  metrics.permits_waiting = static_cast<double>(waiters.size());
}


AdmissionController::AdmissionController(size_t capacity)
  : capacity_(capacity)
{
  CHECK_GT(capacity, 0u);

  process = new AdmissionControllerProcess(capacity);
  spawn(process);
}


AdmissionController::~AdmissionController()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Permit> AdmissionController::acquire()
{
  return dispatch(process, &AdmissionControllerProcess::acquire);
}


void AdmissionController::release(const Permit& permit)
{
  dispatch(process, &AdmissionControllerProcess::release, permit);
}


Future<AdmissionController::Usage> AdmissionController::usage()
{
  return dispatch(process, &AdmissionControllerProcess::usage);
}

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {
