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
#include <memory>
#include <string>

#include <ledger/client/session_endpoint.hxx>
#include <ledger/driver/cursor.hxx>

namespace ledger
{
namespace driver
{
    /**
     * Cursor that fetches each following page synchronously when the current one is used up.
     */
    class stream_cursor : public live_cursor
    {
      public:
        stream_cursor(std::shared_ptr<session_endpoint> endpoint,
                      std::string session_token,
                      std::string transaction_id,
                      execute_statement_result first);

        boost::optional<nlohmann::json> next() override;

        boost::optional<io_usage> consumed_ios() const override
        {
            return consumed_ios_;
        }

        boost::optional<timing_information> timing() const override
        {
            return timing_;
        }

        void close() override
        {
            open_ = false;
        }

        bool is_open() const override
        {
            return open_.load();
        }

      protected:
        virtual bool has_more_pages() const;

        // replaces the current page with the following one
        virtual void next_page();

        void accumulate(const boost::optional<io_usage>& ios, const boost::optional<timing_information>& timing);

        std::shared_ptr<session_endpoint> endpoint_;
        std::string session_token_;
        std::string transaction_id_;
        page page_;
        size_t index_;

      private:
        boost::optional<io_usage> consumed_ios_;
        boost::optional<timing_information> timing_;
        std::atomic<bool> open_;
    };
} // namespace driver
} // namespace ledger
