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

#include <ledger/client/value_codec.hxx>
#include <ledger/driver/exceptions.hxx>

#include "logging.hxx"
#include "stream_cursor.hxx"

namespace ledger
{
namespace driver
{
    stream_cursor::stream_cursor(std::shared_ptr<session_endpoint> endpoint,
                                 std::string session_token,
                                 std::string transaction_id,
                                 execute_statement_result first)
      : endpoint_(std::move(endpoint))
      , session_token_(std::move(session_token))
      , transaction_id_(std::move(transaction_id))
      , page_(std::move(first.first_page))
      , index_(0)
      , open_(true)
    {
        accumulate(first.consumed_ios, first.timing);
    }

    boost::optional<nlohmann::json> stream_cursor::next()
    {
        if (!open_) {
            throw result_closed(session_token_);
        }
        // empty pages in the middle of a result are skipped
        while (index_ >= page_.values.size()) {
            if (!has_more_pages()) {
                return {};
            }
            next_page();
        }
        return value_codec::decode(page_.values[index_++]);
    }

    bool stream_cursor::has_more_pages() const
    {
        return page_.next_page_token.has_value();
    }

    void stream_cursor::next_page()
    {
        driver_log->trace("fetching next page of transaction {}", transaction_id_);
        auto result = endpoint_->fetch_page(session_token_, transaction_id_, *page_.next_page_token);
        accumulate(result.consumed_ios, result.timing);
        page_ = std::move(result.current_page);
        index_ = 0;
    }

    void stream_cursor::accumulate(const boost::optional<io_usage>& ios, const boost::optional<timing_information>& timing)
    {
        if (ios) {
            if (!consumed_ios_) {
                consumed_ios_ = io_usage{};
            }
            consumed_ios_->read_ios += ios->read_ios;
            consumed_ios_->write_ios += ios->write_ios;
        }
        if (timing) {
            if (!timing_) {
                timing_ = timing_information{};
            }
            timing_->processing_time_milliseconds += timing->processing_time_milliseconds;
        }
    }
} // namespace driver
} // namespace ledger
