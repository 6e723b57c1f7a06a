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

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <ledger/client/value_codec.hxx>
#include <ledger/driver/cursor.hxx>
#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    /**
     * @brief The handle passed to an application lambda, bound to one transaction attempt.
     *
     * Do not keep it beyond the lambda.  The lambda may run more than once, so it should have
     * no side effects outside the transaction.
     */
    class executor
    {
      public:
        virtual ~executor() = default;

        /**
         * Runs a statement with positional parameters.  Each parameter is converted to a value
         * with @ref value_codec::to_value.
         *
         * @throws value_conversion_error if a parameter cannot be converted.
         * @throws transaction_closed if the transaction has already finished.
         * @throws endpoint_error if the service rejects the statement.
         */
        template<typename... Params>
        std::shared_ptr<cursor> execute_statement(const std::string& statement, const Params&... params)
        {
            std::vector<nlohmann::json> values{ value_codec::to_value(params)... };
            return execute(statement, values);
        }

        /**
         * Runs a statement whose parameters are already values.
         */
        virtual std::shared_ptr<cursor> execute(const std::string& statement, const std::vector<nlohmann::json>& parameters) = 0;

        /**
         * Abandons the transaction.  Always throws @ref lambda_aborted, which is not retried.
         */
        [[noreturn]] virtual void abort() = 0;

        LEDGER_NODISCARD virtual const std::string& transaction_id() const = 0;
    };
} // namespace driver
} // namespace ledger
