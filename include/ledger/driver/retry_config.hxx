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

#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    /**
     * @brief Retry and backoff policy for @ref driver::execute_lambda.
     *
     * Immutable once constructed.
     */
    class retry_config
    {
      public:
        /**
         * Computes the delay before a retry from the attempt number (1 for the first retry), the
         * error that caused it, and the transaction id (empty if no transaction was started).
         * A negative delay is treated as no delay.
         */
        typedef std::function<std::chrono::milliseconds(uint32_t, const std::exception&, const std::string&)> backoff_fn;

        /**
         * @param retry_limit Number of retries after the first attempt, must not be negative.
         * @param base Base delay of the exponential backoff, must not be negative.  Ignored when
         *             custom_backoff is set.
         * @param custom_backoff Replaces the exponential backoff.
         * @throws std::invalid_argument for a negative retry_limit or base.
         */
        explicit retry_config(int retry_limit = 4,
                              std::chrono::milliseconds base = std::chrono::milliseconds(10),
                              backoff_fn custom_backoff = nullptr);

        LEDGER_NODISCARD uint32_t retry_limit() const
        {
            return retry_limit_;
        }

        LEDGER_NODISCARD std::chrono::milliseconds base() const
        {
            return base_;
        }

        LEDGER_NODISCARD const backoff_fn& custom_backoff() const
        {
            return custom_backoff_;
        }

      private:
        uint32_t retry_limit_;
        std::chrono::milliseconds base_;
        backoff_fn custom_backoff_;
    };
} // namespace driver
} // namespace ledger
