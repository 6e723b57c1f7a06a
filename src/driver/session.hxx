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
#include <string>

#include <boost/optional.hpp>

#include <ledger/client/session_endpoint.hxx>
#include <ledger/driver/driver_config.hxx>
#include <ledger/driver/executor.hxx>
#include <ledger/driver/retry_config.hxx>

#include "retry.hxx"
#include "transaction.hxx"

namespace ledger
{
namespace driver
{
    /**
     * A session on the ledger service.  Used by one caller at a time, runs one transaction at a
     * time.
     *
     * A session becomes dead when the service no longer knows it, or when its state is unknown
     * after a failed abort.  Dead sessions are never reused.
     */
    class session
    {
      public:
        session(std::shared_ptr<session_endpoint> endpoint,
                start_session_result started,
                size_t read_ahead,
                boost::optional<task_executor> executor);

        /**
         * Starts a session on the service.
         *
         * @throws endpoint_error if the service refuses.
         */
        static std::shared_ptr<session> start(std::shared_ptr<session_endpoint> endpoint,
                                              const std::string& ledger_name,
                                              size_t read_ahead,
                                              boost::optional<task_executor> executor);

        LEDGER_NODISCARD const std::string& token() const
        {
            return token_;
        }

        LEDGER_NODISCARD const std::string& id() const
        {
            return id_;
        }

        LEDGER_NODISCARD bool is_alive() const
        {
            return alive_.load();
        }

        /**
         * Runs logic in a transaction, then commits, retrying on this session what can be
         * retried here.  Every retry is counted in state.
         *
         * @throws session_closed if the session has ended or is dead.
         */
        void execute_with_retry(const std::function<void(executor&)>& logic, const retry_config& config, retry_state& state);

        /**
         * @throws start_transaction_failure if the service rejects the request.
         * @throws endpoint_error for any other failure.
         */
        std::unique_ptr<transaction> start_transaction();

        /**
         * Ends the session on the service.  Failures are logged, the service reaps abandoned
         * sessions itself.
         */
        void end();

      private:
        // aborts without throwing, a failure leaves the session dead
        void no_throw_abort(transaction* txn);

        std::shared_ptr<session_endpoint> endpoint_;
        std::string token_;
        std::string id_;
        size_t read_ahead_;
        boost::optional<task_executor> executor_;
        std::atomic<bool> alive_;
    };
} // namespace driver
} // namespace ledger
