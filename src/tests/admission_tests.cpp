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


#include <type_traits>

#include <gtest/gtest.h>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include "sandbox/admission.hpp"

using jailer::internal::sandbox::AdmissionController;
using jailer::internal::sandbox::Permit;

using process::Future;

namespace jailer {
namespace internal {
namespace tests {

TEST(AdmissionControllerTest, Ceiling)
{
  AdmissionController admission(2);

  Future<Permit> first = admission.acquire();
  Future<Permit> second = admission.acquire();
  Future<Permit> third = admission.acquire();

  AWAIT_READY(first);
  AWAIT_READY(second);
  EXPECT_NE(first.get(), second.get());

  Future<AdmissionController::Usage> usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(2u, usage->inFlight);
  EXPECT_EQ(1u, usage->waiting);
  EXPECT_TRUE(third.isPending());

  admission.release(first.get());

  AWAIT_READY(third);

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(2u, usage->inFlight);
  EXPECT_EQ(0u, usage->waiting);
  EXPECT_EQ(3u, usage->acquired);
  EXPECT_EQ(1u, usage->released);

  admission.release(second.get());
  admission.release(third.get());

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(0u, usage->inFlight);
  EXPECT_EQ(3u, usage->released);
}


// Waiters are served in the order in which they asked.
TEST(AdmissionControllerTest, FirstInFirstOut)
{
  AdmissionController admission(1);

  Future<Permit> permit = admission.acquire();
  AWAIT_READY(permit);

  Future<Permit> waiter1 = admission.acquire();
  Future<Permit> waiter2 = admission.acquire();
  Future<Permit> waiter3 = admission.acquire();

  admission.release(permit.get());

  AWAIT_READY(waiter1);
  EXPECT_TRUE(waiter2.isPending());
  EXPECT_TRUE(waiter3.isPending());

  admission.release(waiter1.get());

  AWAIT_READY(waiter2);
  EXPECT_TRUE(waiter3.isPending());

  admission.release(waiter2.get());

  AWAIT_READY(waiter3);

  admission.release(waiter3.get());
}


// A waiter that gives up leaves the queue without taking a permit.
TEST(AdmissionControllerTest, DiscardWaiter)
{
  AdmissionController admission(1);

  Future<Permit> permit = admission.acquire();
  AWAIT_READY(permit);

  Future<Permit> waiter1 = admission.acquire();
  Future<Permit> waiter2 = admission.acquire();

  Future<AdmissionController::Usage> usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(2u, usage->waiting);

  waiter1.discard();
  AWAIT_DISCARDED(waiter1);

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(1u, usage->waiting);

  admission.release(permit.get());

  AWAIT_READY(waiter2);

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(1u, usage->inFlight);
  EXPECT_EQ(0u, usage->waiting);
  EXPECT_EQ(2u, usage->acquired);

  admission.release(waiter2.get());
}


// Releasing a permit twice must not free a second slot.
TEST(AdmissionControllerTest, DoubleRelease)
{
  AdmissionController admission(1);

  Future<Permit> permit = admission.acquire();
  AWAIT_READY(permit);

  admission.release(permit.get());
  admission.release(permit.get());

  Future<AdmissionController::Usage> usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(0u, usage->inFlight);
  EXPECT_EQ(1u, usage->released);

  Future<Permit> first = admission.acquire();
  Future<Permit> second = admission.acquire();

  AWAIT_READY(first);

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(1u, usage->inFlight);
  EXPECT_TRUE(second.isPending());

  // A stale permit does not let the waiter in either.
  admission.release(permit.get());

  usage = admission.usage();
  AWAIT_READY(usage);
  EXPECT_EQ(1u, usage->inFlight);
  EXPECT_TRUE(second.isPending());

  admission.release(first.get());
  AWAIT_READY(second);
  admission.release(second.get());
}


// The controller owns its process and must not be copied.
TEST(AdmissionControllerTest, NonCopyable)
{
  EXPECT_FALSE(std::is_copy_constructible<AdmissionController>::value);
  EXPECT_FALSE(std::is_copy_assignable<AdmissionController>::value);
}

} // namespace tests {
} // namespace internal {
} // namespace jailer {
