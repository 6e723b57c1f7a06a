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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <ledger/client/session_endpoint.hxx>
#include <ledger/driver/cursor.hxx>
#include <ledger/driver/driver_config.hxx>
#include <ledger/driver/executor.hxx>

#include "hash_chain.hxx"

namespace ledger
{
namespace driver
{
    /**
     * One open transaction on a session.  Open until committed or aborted, never reopened.
     *
     * Keeps the running commit digest: the hash of the transaction id, combined in order with
     * the hash of each executed statement.
     */
    class transaction
    {
      public:
        transaction(std::shared_ptr<session_endpoint> endpoint,
                    std::string session_token,
                    std::string transaction_id,
                    size_t read_ahead,
                    boost::optional<task_executor> executor);

        LEDGER_NODISCARD const std::string& id() const
        {
            return id_;
        }

        LEDGER_NODISCARD bool is_closed() const
        {
            return closed_;
        }

        LEDGER_NODISCARD const ledger_hash& digest() const
        {
            return digest_;
        }

        /**
         * @throws transaction_closed if already committed or aborted.
         * @throws value_conversion_error if a parameter has no wire encoding.
         */
        std::shared_ptr<cursor> execute_statement(const std::string& statement, const std::vector<nlohmann::json>& parameters);

        /**
         * Commits with the running digest.  Whatever the outcome the transaction ends up closed
         * along with every cursor it returned.
         *
         * @throws transaction_closed if already committed or aborted.
         * @throws digest_mismatch if the service computed a different digest.
         */
        void commit();

        /**
         * Closes the transaction and asks the service to abort it.  Does nothing if already
         * closed.  Errors from the service are thrown.
         */
        void abort();

      private:
        void close();

        std::shared_ptr<session_endpoint> endpoint_;
        std::string session_token_;
        std::string id_;
        size_t read_ahead_;
        boost::optional<task_executor> executor_;
        ledger_hash digest_;
        std::vector<std::shared_ptr<live_cursor>> cursors_;
        bool closed_;
    };

    /**
     * The executor handed to application lambdas, forwarding to one transaction.
     */
    class transaction_executor : public executor
    {
      public:
        explicit transaction_executor(transaction& txn)
          : txn_(txn)
        {
        }

        std::shared_ptr<cursor> execute(const std::string& statement, const std::vector<nlohmann::json>& parameters) override
        {
            return txn_.execute_statement(statement, parameters);
        }

        [[noreturn]] void abort() override;

        const std::string& transaction_id() const override
        {
            return txn_.id();
        }

      private:
        transaction& txn_;
    };
} // namespace driver
} // namespace ledger
