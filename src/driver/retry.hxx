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
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include <ledger/driver/driver_testing_hooks.hxx>
#include <ledger/driver/retry_config.hxx>

namespace ledger
{
namespace driver
{
    static const std::chrono::milliseconds MAX_BACKOFF(5000);
    static const uint32_t MAX_BACKOFF_EXPONENT = 62;

    /**
     * Attempt accounting for one execute_lambda call.  Shared by the session loop and the driver
     * loop, so every retry at either layer consumes the same retry_limit budget.
     */
    struct retry_state {
        uint32_t attempts{ 0 };
        std::function<void(std::chrono::milliseconds)> sleep{ default_sleep };

        bool can_retry(const retry_config& config) const
        {
            return attempts < config.retry_limit();
        }
    };

    /**
     * Delay before retry number attempt (1 for the first retry).
     *
     * Without a custom backoff this is equal jitter: a random value in [seed / 2, seed] where
     * seed = min(base * 2^attempt, MAX_BACKOFF).
     */
    std::chrono::milliseconds
    compute_backoff(uint32_t attempt, const std::exception& error, const std::string& transaction_id, const retry_config& config);

    /**
     * Counts the attempt, computes its backoff and sleeps through it.
     */
    void
    backoff_and_count(retry_state& state, const std::exception& error, const std::string& transaction_id, const retry_config& config);
} // namespace driver
} // namespace ledger
