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
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include <boost/optional.hpp>

#include <ledger/driver/driver_config.hxx>

#include "stream_cursor.hxx"

namespace ledger
{
namespace driver
{
    // how long the worker waits for room in the queue before checking the cursor is still open
    static const std::chrono::milliseconds READ_AHEAD_PUSH_TIMEOUT(50);

    struct read_ahead_state;

    /**
     * Cursor that fetches following pages on a background worker, keeping up to read_ahead - 1
     * pages buffered ahead of the consumer.
     *
     * The worker runs on the task executor if one is given, otherwise on a thread owned by the
     * cursor and joined when it is destroyed.
     */
    class read_ahead_cursor : public stream_cursor
    {
      public:
        read_ahead_cursor(std::shared_ptr<session_endpoint> endpoint,
                          std::string session_token,
                          std::string transaction_id,
                          execute_statement_result first,
                          size_t read_ahead,
                          const boost::optional<task_executor>& executor);

        ~read_ahead_cursor() override;

        void close() override;

        /**
         * Pages fetched by the worker and not yet consumed.
         */
        size_t pages_buffered() const;

        /**
         * Largest number of pages ever buffered at once.
         */
        size_t max_pages_buffered() const;

      protected:
        bool has_more_pages() const override;

        void next_page() override;

      private:
        std::shared_ptr<read_ahead_state> state_;
        std::thread worker_;
        std::exception_ptr failure_;
    };
} // namespace driver
} // namespace ledger
