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

#include <utility>

#include "buffered_cursor.hxx"

namespace ledger
{
namespace driver
{
    buffered_cursor::buffered_cursor(cursor& source)
      : index_(0)
    {
        while (auto value = source.next()) {
            values_.push_back(std::move(*value));
        }
        consumed_ios_ = source.consumed_ios();
        timing_ = source.timing();
    }

    buffered_cursor::buffered_cursor(std::vector<nlohmann::json> values,
                                     boost::optional<io_usage> consumed_ios,
                                     boost::optional<timing_information> timing)
      : values_(std::move(values))
      , index_(0)
      , consumed_ios_(std::move(consumed_ios))
      , timing_(std::move(timing))
    {
    }

    boost::optional<nlohmann::json> buffered_cursor::next()
    {
        if (index_ >= values_.size()) {
            return {};
        }
        return values_[index_++];
    }

    namespace detail
    {
        void
        materialize(std::shared_ptr<cursor>& result)
        {
            auto live = std::dynamic_pointer_cast<live_cursor>(result);
            if (live && live->is_open()) {
                result = std::make_shared<buffered_cursor>(*live);
            }
        }
    } // namespace detail
} // namespace driver
} // namespace ledger
