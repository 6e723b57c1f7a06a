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
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <ledger/driver/driver_testing_hooks.hxx>
#include <ledger/driver/retry_config.hxx>
#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    /**
     * Runs a task on a caller-owned thread pool.  When configured, read-ahead cursors schedule
     * their background page fetches through it instead of starting a dedicated thread.
     */
    typedef std::function<void(std::function<void()>)> task_executor;

    /**
     * @brief Tunables for the driver.
     */
    class driver_config
    {
      public:
        driver_config();

        explicit driver_config(std::string ledger_name);

        LEDGER_NODISCARD const std::string& ledger_name() const
        {
            return ledger_name_;
        }

        void ledger_name(std::string name)
        {
            ledger_name_ = std::move(name);
        }

        /**
         * Maximum number of sessions, and so of concurrent transactions.  0 means the maximum
         * number of connections the transport allows.
         */
        LEDGER_NODISCARD size_t max_concurrent_transactions() const
        {
            return max_concurrent_transactions_;
        }

        /**
         * @throws std::invalid_argument if limit is negative.
         */
        void max_concurrent_transactions(int limit);

        LEDGER_NODISCARD std::chrono::milliseconds pool_timeout() const
        {
            return pool_timeout_;
        }

        template<typename T>
        void pool_timeout(T duration)
        {
            auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
            if (timeout.count() < 0) {
                throw std::invalid_argument("pool timeout must not be negative");
            }
            pool_timeout_ = timeout;
        }

        /**
         * Number of result pages to fetch ahead of the application.  0 disables read-ahead,
         * 1 is not allowed since the cursor already holds the current page.
         */
        LEDGER_NODISCARD size_t read_ahead() const
        {
            return read_ahead_;
        }

        /**
         * @throws std::invalid_argument if pages is negative or 1.
         */
        void read_ahead(int pages);

        LEDGER_NODISCARD const retry_config& retry() const
        {
            return retry_;
        }

        void retry(retry_config config)
        {
            retry_ = std::move(config);
        }

        LEDGER_NODISCARD const boost::optional<task_executor>& executor() const
        {
            return executor_;
        }

        void executor(task_executor executor)
        {
            executor_ = std::move(executor);
        }

        void test_hooks(driver_testing_hooks hooks)
        {
            hooks_ = std::move(hooks);
        }

        LEDGER_NODISCARD const driver_testing_hooks& testing_hooks() const
        {
            return hooks_;
        }

      private:
        std::string ledger_name_;
        size_t max_concurrent_transactions_;
        std::chrono::milliseconds pool_timeout_;
        size_t read_ahead_;
        retry_config retry_;
        boost::optional<task_executor> executor_;
        driver_testing_hooks hooks_;
    };

    /**
     * Reads the keys ledger_name, max_concurrent_transactions, pool_timeout_ms, read_ahead,
     * retry_limit and retry_base_ms.  Keys that are absent keep their current value.
     *
     * @throws std::invalid_argument for a value out of range, nlohmann::json::exception for a value
     *         of the wrong type.
     */
    void from_json(const nlohmann::json& j, driver_config& config);
} // namespace driver
} // namespace ledger
