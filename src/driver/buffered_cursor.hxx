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
#include <vector>

#include <ledger/driver/cursor.hxx>

namespace ledger
{
namespace driver
{
    /**
     * Cursor over rows held in memory.  Independent of any transaction.
     */
    class buffered_cursor : public cursor
    {
      public:
        /**
         * Drains source, keeping its accumulated statistics.
         */
        explicit buffered_cursor(cursor& source);

        buffered_cursor(std::vector<nlohmann::json> values, boost::optional<io_usage> consumed_ios, boost::optional<timing_information> timing);

        boost::optional<nlohmann::json> next() override;

        boost::optional<io_usage> consumed_ios() const override
        {
            return consumed_ios_;
        }

        boost::optional<timing_information> timing() const override
        {
            return timing_;
        }

        // owns no live resource
        void close() override
        {
        }

        size_t size() const
        {
            return values_.size();
        }

      private:
        std::vector<nlohmann::json> values_;
        size_t index_;
        boost::optional<io_usage> consumed_ios_;
        boost::optional<timing_information> timing_;
    };
} // namespace driver
} // namespace ledger
