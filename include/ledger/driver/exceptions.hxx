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
#include <stdexcept>
#include <string>

#include <ledger/client/exceptions.hxx>
#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    /**
     * @brief Base class for errors raised by the driver itself, as opposed to errors returned by
     * the ledger service (see @ref ledger::endpoint_error).
     */
    class driver_exception : public std::runtime_error
    {
      public:
        explicit driver_exception(const std::string& what)
          : std::runtime_error(what)
        {
        }
    };

    /**
     * @brief The driver was closed, create a new one.
     */
    class driver_closed : public driver_exception
    {
      public:
        driver_closed()
          : driver_exception("Cannot invoke methods on a closed driver. Please create a new driver and retry.")
        {
        }
    };

    /**
     * @brief No session became available within the pool timeout.
     */
    class pool_exhausted : public driver_exception
    {
      private:
        std::chrono::milliseconds timeout_;

      public:
        explicit pool_exhausted(std::chrono::milliseconds timeout)
          : driver_exception("Session pool is empty after waiting for " + std::to_string(timeout.count()) +
                             "ms. Please close existing sessions first before retrying.")
          , timeout_(timeout)
        {
        }

        LEDGER_NODISCARD std::chrono::milliseconds timeout() const
        {
            return timeout_;
        }
    };

    class session_closed : public driver_exception
    {
      public:
        session_closed()
          : driver_exception("Cannot invoke methods on a closed session. Please start a new session and retry.")
        {
        }
    };

    class transaction_closed : public driver_exception
    {
      public:
        transaction_closed()
          : driver_exception("Cannot invoke methods on a closed transaction. Please start a new transaction and retry.")
        {
        }
    };

    /**
     * @brief A streamed result was read after its transaction was committed or aborted.
     */
    class result_closed : public driver_exception
    {
      public:
        explicit result_closed(const std::string& session_token)
          : driver_exception("A streamed result is only valid when the parent transaction is open. Please start a new transaction "
                             "and retry. Session token: " +
                             session_token)
        {
        }
    };

    /**
     * @brief Raised by @ref executor::abort.  Never retried.
     */
    class lambda_aborted : public driver_exception
    {
      public:
        lambda_aborted()
          : driver_exception("Abort invoked; halting execution of lambda function.")
        {
        }
    };

    /**
     * @brief The service refused to start a transaction.
     *
     * Distinguishes a failure before any statement ran from one that happened during the lambda.
     * If retries are exhausted, the inner @ref error() is what the application sees.
     */
    class start_transaction_failure : public driver_exception
    {
      private:
        endpoint_error error_;

      public:
        explicit start_transaction_failure(const endpoint_error& error)
          : driver_exception(std::string("Failed to start transaction: ") + error.what())
          , error_(error)
        {
        }

        LEDGER_NODISCARD const endpoint_error& error() const
        {
            return error_;
        }
    };

    /**
     * @brief The commit digest returned by the service differs from the one computed locally.
     *
     * The transaction must not be assumed to have taken effect as intended.
     */
    class digest_mismatch : public driver_exception
    {
      public:
        explicit digest_mismatch(const std::string& transaction_id)
          : driver_exception("Transaction's commit digest did not match returned value from the ledger. Please retry with a new "
                             "transaction. Transaction ID: " +
                             transaction_id)
        {
        }
    };
} // namespace driver
} // namespace ledger
