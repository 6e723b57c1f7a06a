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

#include <ledger/client/value_codec.hxx>
#include <ledger/driver/exceptions.hxx>

#include "logging.hxx"
#include "read_ahead_cursor.hxx"
#include "stream_cursor.hxx"
#include "transaction.hxx"

namespace ledger
{
namespace driver
{
    transaction::transaction(std::shared_ptr<session_endpoint> endpoint,
                             std::string session_token,
                             std::string transaction_id,
                             size_t read_ahead,
                             boost::optional<task_executor> executor)
      : endpoint_(std::move(endpoint))
      , session_token_(std::move(session_token))
      , id_(std::move(transaction_id))
      , read_ahead_(read_ahead)
      , executor_(std::move(executor))
      , digest_(ledger_hash::of(nlohmann::json(id_)))
      , closed_(false)
    {
    }

    std::shared_ptr<cursor> transaction::execute_statement(const std::string& statement, const std::vector<nlohmann::json>& parameters)
    {
        if (closed_) {
            throw transaction_closed();
        }
        std::vector<std::string> encoded;
        encoded.reserve(parameters.size());
        for (const auto& param : parameters) {
            encoded.push_back(value_codec::encode(param));
        }
        digest_ = digest_.dot(statement_hash(statement, encoded));
        driver_log->trace("transaction {} executing statement with {} parameters", id_, encoded.size());
        auto result = endpoint_->execute_statement(session_token_, id_, statement, encoded);
        std::shared_ptr<live_cursor> c;
        if (read_ahead_ > 0) {
            c = std::make_shared<read_ahead_cursor>(endpoint_, session_token_, id_, std::move(result), read_ahead_, executor_);
        } else {
            c = std::make_shared<stream_cursor>(endpoint_, session_token_, id_, std::move(result));
        }
        cursors_.push_back(c);
        return c;
    }

    void transaction::commit()
    {
        if (closed_) {
            throw transaction_closed();
        }
        commit_transaction_result result;
        try {
            result = endpoint_->commit_transaction(session_token_, id_, digest_.bytes());
        } catch (const endpoint_error& e) {
            driver_log->debug("commit of transaction {} failed: {}", id_, e.what());
            close();
            throw;
        }
        close();
        if (result.commit_digest != digest_.bytes()) {
            driver_log->error("commit digest of transaction {} does not match, expected {}", id_, digest_.to_hex());
            throw digest_mismatch(id_);
        }
        driver_log->trace("transaction {} committed", id_);
    }

    void transaction::abort()
    {
        if (closed_) {
            return;
        }
        close();
        endpoint_->abort_transaction(session_token_);
        driver_log->trace("transaction {} aborted", id_);
    }

    void transaction::close()
    {
        closed_ = true;
        for (auto& c : cursors_) {
            c->close();
        }
        cursors_.clear();
    }

    void transaction_executor::abort()
    {
        throw lambda_aborted();
    }
} // namespace driver
} // namespace ledger
