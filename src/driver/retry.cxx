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

#include <algorithm>
#include <random>

#include "logging.hxx"
#include "retry.hxx"

namespace ledger
{
namespace driver
{
    static int64_t
    equal_jitter(int64_t seed)
    {
        static thread_local std::mt19937 gen{ std::random_device{}() };
        std::uniform_int_distribution<int64_t> dis(0, seed / 2);
        return seed / 2 + dis(gen);
    }

    std::chrono::milliseconds
    compute_backoff(uint32_t attempt, const std::exception& error, const std::string& transaction_id, const retry_config& config)
    {
        if (config.custom_backoff()) {
            auto delay = config.custom_backoff()(attempt, error, transaction_id);
            return std::max(delay, std::chrono::milliseconds(0));
        }
        uint32_t exponent = std::min(attempt, MAX_BACKOFF_EXPONENT);
        int64_t base = config.base().count();
        int64_t seed;
        // base * 2^exponent saturates at MAX_BACKOFF without overflowing
        if (base > (MAX_BACKOFF.count() >> exponent)) {
            seed = MAX_BACKOFF.count();
        } else {
            seed = base << exponent;
        }
        return std::chrono::milliseconds(equal_jitter(seed));
    }

    void
    backoff_and_count(retry_state& state, const std::exception& error, const std::string& transaction_id, const retry_config& config)
    {
        state.attempts++;
        auto delay = compute_backoff(state.attempts, error, transaction_id, config);
        driver_log->debug("retry {} of {} in {}ms after: {}", state.attempts, config.retry_limit(), delay.count(), error.what());
        state.sleep(delay);
    }
} // namespace driver
} // namespace ledger
