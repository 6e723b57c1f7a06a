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

#include <atomic>
#include <stdexcept>

#include <ledger/driver/exceptions.hxx>

#include "blocking_queue.hxx"
#include "logging.hxx"
#include "read_ahead_cursor.hxx"

namespace ledger
{
namespace driver
{
    // a fetched page, or the error that stopped the worker
    struct queued_page {
        boost::optional<fetch_page_result> result;
        std::exception_ptr error;
    };

    struct read_ahead_state {
        read_ahead_state(std::shared_ptr<session_endpoint> endpoint, std::string session_token, std::string transaction_id, size_t capacity)
          : endpoint(std::move(endpoint))
          , session_token(std::move(session_token))
          , transaction_id(std::move(transaction_id))
          , queue(capacity)
          , open(true)
        {
        }

        std::shared_ptr<session_endpoint> endpoint;
        std::string session_token;
        std::string transaction_id;
        blocking_queue<queued_page> queue;
        std::atomic<bool> open;
    };

    static void
    populate_queue(std::shared_ptr<read_ahead_state> state, boost::optional<std::string> next_page_token)
    {
        try {
            while (next_page_token) {
                if (!state->open) {
                    throw result_closed(state->session_token);
                }
                auto result = state->endpoint->fetch_page(state->session_token, state->transaction_id, *next_page_token);
                next_page_token = result.current_page.next_page_token;
                queued_page item{ std::move(result), nullptr };
                while (!state->queue.push_for(item, READ_AHEAD_PUSH_TIMEOUT)) {
                    if (!state->open) {
                        throw result_closed(state->session_token);
                    }
                }
            }
            driver_log->trace("read-ahead of transaction {} reached the last page", state->transaction_id);
        } catch (const std::exception& e) {
            driver_log->debug("read-ahead of transaction {} stopped: {}", state->transaction_id, e.what());
            // make room so the sentinel never blocks
            state->queue.clear();
            state->queue.push(queued_page{ boost::none, std::current_exception() });
        }
    }

    read_ahead_cursor::read_ahead_cursor(std::shared_ptr<session_endpoint> endpoint,
                                         std::string session_token,
                                         std::string transaction_id,
                                         execute_statement_result first,
                                         size_t read_ahead,
                                         const boost::optional<task_executor>& executor)
      : stream_cursor(std::move(endpoint), std::move(session_token), std::move(transaction_id), std::move(first))
    {
        if (read_ahead < 2) {
            throw std::invalid_argument("read ahead must be at least 2");
        }
        state_ = std::make_shared<read_ahead_state>(endpoint_, session_token_, transaction_id_, read_ahead - 1);
        if (!page_.next_page_token) {
            return;
        }
        auto state = state_;
        auto token = page_.next_page_token;
        if (executor) {
            (*executor)([state, token]() { populate_queue(state, token); });
        } else {
            worker_ = std::thread(populate_queue, state, token);
        }
    }

    read_ahead_cursor::~read_ahead_cursor()
    {
        state_->open = false;
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void read_ahead_cursor::close()
    {
        stream_cursor::close();
        state_->open = false;
    }

    size_t read_ahead_cursor::pages_buffered() const
    {
        return state_->queue.size();
    }

    size_t read_ahead_cursor::max_pages_buffered() const
    {
        return state_->queue.high_water_mark();
    }

    bool read_ahead_cursor::has_more_pages() const
    {
        return failure_ || page_.next_page_token || !state_->queue.empty();
    }

    void read_ahead_cursor::next_page()
    {
        if (failure_) {
            std::rethrow_exception(failure_);
        }
        auto item = state_->queue.pop();
        if (item.error) {
            failure_ = item.error;
            std::rethrow_exception(failure_);
        }
        accumulate(item.result->consumed_ios, item.result->timing);
        page_ = std::move(item.result->current_page);
        index_ = 0;
    }
} // namespace driver
} // namespace ledger
