/*
 *     Copyright 2022 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace ledger
{
namespace driver
{
    inline void
    default_sleep(std::chrono::milliseconds delay)
    {
        std::this_thread::sleep_for(delay);
    }

    /**
     * Hooks purely for testing purposes.  They let tests observe retry behavior without waiting
     * for real backoff delays.
     */
    struct driver_testing_hooks {
        std::function<void(std::chrono::milliseconds)> sleep = default_sleep;
    };
} // namespace driver
} // namespace ledger
