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

#include <ledger/driver/exceptions.hxx>

#include "exceptions_internal.hxx"
#include "logging.hxx"
#include "session.hxx"

namespace ledger
{
namespace driver
{
    session::session(std::shared_ptr<session_endpoint> endpoint,
                     start_session_result started,
                     size_t read_ahead,
                     boost::optional<task_executor> executor)
      : endpoint_(std::move(endpoint))
      , token_(std::move(started.session_token))
      , id_(std::move(started.session_id))
      , read_ahead_(read_ahead)
      , executor_(std::move(executor))
      , alive_(true)
    {
    }

    std::shared_ptr<session> session::start(std::shared_ptr<session_endpoint> endpoint,
                                            const std::string& ledger_name,
                                            size_t read_ahead,
                                            boost::optional<task_executor> executor)
    {
        auto started = endpoint->start_session(ledger_name);
        driver_log->debug("[{}]: started session on ledger {}", started.session_id, ledger_name);
        return std::make_shared<session>(std::move(endpoint), std::move(started), read_ahead, std::move(executor));
    }

    std::unique_ptr<transaction> session::start_transaction()
    {
        try {
            auto result = endpoint_->start_transaction(token_);
            driver_log->trace("[{}]: started transaction {}", id_, result.transaction_id);
            return std::make_unique<transaction>(endpoint_, token_, std::move(result.transaction_id), read_ahead_, executor_);
        } catch (const endpoint_error& e) {
            if (is_bad_request(e)) {
                throw start_transaction_failure(e);
            }
            throw;
        }
    }

    void session::execute_with_retry(const std::function<void(executor&)>& logic, const retry_config& config, retry_state& state)
    {
        if (!alive_) {
            throw session_closed();
        }
        while (true) {
            std::unique_ptr<transaction> txn;
            try {
                txn = start_transaction();
                transaction_executor ex(*txn);
                logic(ex);
                txn->commit();
                return;
            } catch (const lambda_aborted&) {
                driver_log->debug("[{}]: lambda aborted", id_);
                no_throw_abort(txn.get());
                throw;
            } catch (const start_transaction_failure& e) {
                no_throw_abort(nullptr);
                if (!state.can_retry(config) || !alive_) {
                    throw e.error();
                }
                backoff_and_count(state, e.error(), std::string(), config);
            } catch (const endpoint_error& e) {
                std::string txn_id = txn ? txn->id() : std::string();
                switch (error_class_from_error(e)) {
                    case FAIL_INVALID_SESSION:
                        driver_log->debug("[{}]: session is no longer valid: {}", id_, e.what());
                        alive_ = false;
                        throw;
                    case FAIL_OCC_CONFLICT:
                        driver_log->debug("[{}]: OCC conflict on transaction {}", id_, txn_id);
                        break;
                    case FAIL_TRANSACTION_EXPIRED:
                    case FAIL_TRANSIENT:
                        no_throw_abort(txn.get());
                        break;
                    default:
                        no_throw_abort(txn.get());
                        throw;
                }
                if (!state.can_retry(config) || !alive_) {
                    throw;
                }
                backoff_and_count(state, e, txn_id, config);
            } catch (const std::exception& e) {
                driver_log->trace("[{}]: lambda failed, not retried: {}", id_, e.what());
                no_throw_abort(txn.get());
                throw;
            } catch (...) {
                driver_log->trace("[{}]: lambda failed with a non-standard exception, not retried", id_);
                no_throw_abort(txn.get());
                throw;
            }
        }
    }

    void session::no_throw_abort(transaction* txn)
    {
        try {
            if (txn != nullptr && !txn->is_closed()) {
                txn->abort();
            } else {
                endpoint_->abort_transaction(token_);
            }
        } catch (const std::exception& e) {
            driver_log->warn("[{}]: ignoring error aborting transaction, session will not be reused: {}", id_, e.what());
            alive_ = false;
        }
    }

    void session::end()
    {
        if (!alive_.exchange(false)) {
            return;
        }
        try {
            endpoint_->end_session(token_);
            driver_log->debug("[{}]: ended session", id_);
        } catch (const std::exception& e) {
            driver_log->warn("[{}]: ignoring error ending session: {}", id_, e.what());
        }
    }
} // namespace driver
} // namespace ledger
