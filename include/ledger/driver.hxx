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

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/optional.hpp>

#include <ledger/client/session_endpoint.hxx>
#include <ledger/driver/cursor.hxx>
#include <ledger/driver/driver_config.hxx>
#include <ledger/driver/exceptions.hxx>
#include <ledger/driver/executor.hxx>
#include <ledger/driver/retry_config.hxx>
#include <ledger/support.hxx>

namespace ledger
{
template<typename T>
class pool;

namespace driver
{
    class session;

    /**
     * @brief Entry point of the library.
     *
     * Owns a bounded pool of sessions on one ledger and runs application lambdas in
     * transactions on them, retrying transient failures.  Thread safe.
     *
     * @code{.cpp}
     * ledger::driver::driver_config config("vehicle-registration");
     * ledger::driver::driver d(endpoint, config);
     * auto count = d.execute_lambda([](ledger::driver::executor& ex) {
     *     auto rows = ex.execute_statement("SELECT * FROM Person WHERE GovId = ?", "TOYENC486FH");
     *     size_t n = 0;
     *     while (rows->next()) {
     *         n++;
     *     }
     *     return n;
     * });
     * @endcode
     */
    class driver
    {
      public:
        /**
         * @throws std::invalid_argument if the configured concurrency exceeds what the endpoint
         *         supports.
         */
        driver(std::shared_ptr<session_endpoint> endpoint, const driver_config& config);

        /**
         * Closes the driver, see @ref close.
         */
        ~driver();

        driver(const driver&) = delete;
        driver& operator=(const driver&) = delete;

        /**
         * @brief Run a lambda in a transaction, with the configured retry policy.
         *
         * The lambda receives an @ref executor and may return a value, which is returned once
         * the transaction has committed.  A cursor returned by the lambda is read fully into
         * memory before the commit.
         *
         * Errors the driver cannot retry, and the last error once the retry limit is reached,
         * propagate to the caller: @ref ledger::endpoint_error for service errors,
         * @ref driver_exception subclasses for driver errors, or whatever the lambda threw.
         *
         * @throws driver_closed if the driver has been closed.
         * @throws pool_exhausted if no session became available within the pool timeout.
         */
        template<typename Logic>
        std::invoke_result_t<Logic&, executor&> execute_lambda(Logic&& logic)
        {
            return execute_lambda(std::forward<Logic>(logic), config_.retry());
        }

        /**
         * @brief Run a lambda in a transaction, with a retry policy for this call only.
         */
        template<typename Logic>
        std::invoke_result_t<Logic&, executor&> execute_lambda(Logic&& logic, const retry_config& retry)
        {
            using result_type = std::invoke_result_t<Logic&, executor&>;
            if constexpr (std::is_void_v<result_type>) {
                run([&logic](executor& ex) { logic(ex); }, retry);
            } else {
                boost::optional<result_type> result;
                run(
                  [&logic, &result](executor& ex) {
                      result_type value = logic(ex);
                      detail::materialize(value);
                      result = std::move(value);
                  },
                  retry);
                return std::move(*result);
            }
        }

        /**
         * Names of the active tables of the ledger.
         */
        std::shared_ptr<cursor> list_tables();

        /**
         * Ends every idle session and rejects further calls.  Sessions in use are ended when
         * they are released.  Idempotent.
         */
        void close();

        LEDGER_NODISCARD bool is_closed() const
        {
            return closed_.load();
        }

        LEDGER_NODISCARD const driver_config& config() const
        {
            return config_;
        }

        /**
         * Maximum number of sessions the driver will hold at once.
         */
        LEDGER_NODISCARD size_t pool_limit() const
        {
            return pool_limit_;
        }

        /**
         * Number of sessions that could still be handed out without waiting.
         */
        LEDGER_NODISCARD size_t available_permits() const;

        /**
         * Number of started sessions waiting in the pool.
         */
        LEDGER_NODISCARD size_t idle_sessions() const;

        /**
         * @internal
         * Waits up to the pool timeout for a permit, then hands out an idle session or starts a
         * new one.  With force_new, idle sessions are skipped.
         */
        std::shared_ptr<session> get_session(bool force_new = false);

        /**
         * @internal
         * Returns a session and its permit.  A session that is no longer alive is dropped.
         */
        void release_session(std::shared_ptr<session> session);

      private:
        void run(const std::function<void(executor&)>& logic, const retry_config& retry);

        std::shared_ptr<session_endpoint> endpoint_;
        driver_config config_;
        size_t pool_limit_;
        std::unique_ptr<pool<std::shared_ptr<session>>> pool_;
        std::atomic<bool> closed_;
    };
} // namespace driver
} // namespace ledger
