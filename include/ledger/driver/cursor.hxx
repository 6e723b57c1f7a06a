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

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <ledger/client/session_endpoint.hxx>
#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    /**
     * @brief Iterates the rows returned by a statement.
     *
     * Rows are decoded into @ref nlohmann::json values.  A cursor is single-pass and not safe
     * for concurrent use.
     */
    class cursor
    {
      public:
        virtual ~cursor() = default;

        /**
         * Next row, or none once the result is exhausted.
         *
         * @throws result_closed if the owning transaction has been committed or aborted.
         */
        virtual boost::optional<nlohmann::json> next() = 0;

        /**
         * I/O usage summed over every page fetched so far, none if the service reported none.
         */
        LEDGER_NODISCARD virtual boost::optional<io_usage> consumed_ios() const = 0;

        /**
         * Server processing time summed over every page fetched so far.
         */
        LEDGER_NODISCARD virtual boost::optional<timing_information> timing() const = 0;

        virtual void close() = 0;
    };

    /**
     * A cursor still bound to an open transaction, pulling pages from the service.
     */
    class live_cursor : public cursor
    {
      public:
        LEDGER_NODISCARD virtual bool is_open() const = 0;
    };

    namespace detail
    {
        template<typename R>
        void
        materialize(R&)
        {
        }

        /**
         * Replaces a live cursor with an in-memory copy of its remaining rows, so the result
         * survives the commit of its transaction.
         */
        void
        materialize(std::shared_ptr<cursor>& result);
    } // namespace detail
} // namespace driver
} // namespace ledger
