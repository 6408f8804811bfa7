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


#ifndef __SANDBOX_ADMISSION_HPP__
#define __SANDBOX_ADMISSION_HPP__

#include <ostream>

#include <process/future.hpp>

#include <stout/uuid.hpp>

namespace jailer {
namespace internal {
namespace sandbox {

// Forward declarations.
class AdmissionControllerProcess;


// Grants the right to run one execution. Obtained through
// 'AdmissionController::acquire()' and handed back exactly once
// through 'AdmissionController::release()'.
struct Permit
{
  explicit Permit(const id::UUID& _id) : id(_id) {}

  bool operator==(const Permit& that) const { return id == that.id; }
  bool operator!=(const Permit& that) const { return !(*this == that); }

  id::UUID id;
};


std::ostream& operator<<(std::ostream& stream, const Permit& permit);


// Bounds the number of executions in flight with a fixed pool of
// permits. Callers waiting for a permit are served first in first out.
class AdmissionController
{
public:
  struct Usage
  {
    size_t inFlight;
    size_t waiting;
    uint64_t acquired;
    uint64_t released;
  };

  explicit AdmissionController(size_t capacity);
  virtual ~AdmissionController();

  // Completes once a permit is available. Discarding the returned
  // future gives up the place in the queue.
  virtual process::Future<Permit> acquire();

  // Returns the permit to the pool. Releasing a permit that is not
  // in flight is logged and otherwise ignored.
  virtual void release(const Permit& permit);

  virtual process::Future<Usage> usage();

  size_t capacity() const { return capacity_; }

private:
  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;

  const size_t capacity_;

  AdmissionControllerProcess* process;
};

} // namespace sandbox {
} // namespace internal {
} // namespace jailer {

#endif // __SANDBOX_ADMISSION_HPP__
