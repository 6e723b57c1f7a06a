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

#include <stdexcept>
#include <utility>

#include <ledger/driver.hxx>

#include "../client/pool.hxx"
#include "buffered_cursor.hxx"
#include "exceptions_internal.hxx"
#include "logging.hxx"
#include "retry.hxx"
#include "session.hxx"

namespace ledger
{
namespace driver
{
    // extra session acquisitions allowed per call, beyond the pool limit
    static const size_t SESSION_ACQUISITION_HEADROOM = 3;

    static const std::string TABLE_NAMES_QUERY("SELECT name FROM information_schema.user_tables WHERE status = 'ACTIVE'");

    driver::driver(std::shared_ptr<session_endpoint> endpoint, const driver_config& config)
      : endpoint_(std::move(endpoint))
      , config_(config)
      , pool_limit_(0)
      , closed_(false)
    {
        if (!endpoint_) {
            throw std::invalid_argument("driver needs an endpoint");
        }
        size_t max_connections = endpoint_->max_connections();
        if (config_.max_concurrent_transactions() > max_connections) {
            throw std::invalid_argument("max concurrent transactions (" + std::to_string(config_.max_concurrent_transactions()) +
                                        ") cannot exceed the maximum number of connections of the endpoint (" +
                                        std::to_string(max_connections) + ")");
        }
        pool_limit_ = config_.max_concurrent_transactions() == 0 ? max_connections : config_.max_concurrent_transactions();
        auto ep = endpoint_;
        auto ledger_name = config_.ledger_name();
        auto read_ahead = config_.read_ahead();
        auto tasks = config_.executor();
        pool_.reset(new pool<std::shared_ptr<session>>(
          pool_limit_,
          [ep, ledger_name, read_ahead, tasks]() { return session::start(ep, ledger_name, read_ahead, tasks); },
          [](std::shared_ptr<session>& s) { s->end(); }));
        driver_log->info("driver created for ledger {} with a pool of {} sessions", ledger_name, pool_limit_);
    }

    driver::~driver()
    {
        close();
    }

    std::shared_ptr<session> driver::get_session(bool force_new)
    {
        if (closed_) {
            throw driver_closed();
        }
        auto s = pool_->try_get(config_.pool_timeout(), force_new);
        if (!s) {
            throw pool_exhausted(config_.pool_timeout());
        }
        driver_log->trace("[{}]: session checked out, {} permits left", (*s)->id(), pool_->available());
        return *s;
    }

    void driver::release_session(std::shared_ptr<session> s)
    {
        bool alive = s->is_alive();
        driver_log->trace("[{}]: session released, alive: {}", s->id(), alive);
        pool_->release(std::move(s), alive);
    }

    void driver::run(const std::function<void(executor&)>& logic, const retry_config& retry)
    {
        retry_state state;
        state.sleep = config_.testing_hooks().sleep;
        bool force_new = false;
        const size_t max_acquisitions = pool_limit_ + SESSION_ACQUISITION_HEADROOM;
        for (size_t acquisitions = 1;; ++acquisitions) {
            std::shared_ptr<session> s;
            try {
                s = get_session(force_new);
            } catch (const endpoint_error& e) {
                if (!is_retriable_transport(e) || !state.can_retry(retry) || acquisitions >= max_acquisitions) {
                    throw;
                }
                backoff_and_count(state, e, std::string(), retry);
                continue;
            }
            try {
                s->execute_with_retry(logic, retry, state);
            } catch (const endpoint_error& e) {
                bool alive = s->is_alive();
                release_session(s);
                if (alive || !is_retriable(error_class_from_error(e)) || !state.can_retry(retry) || acquisitions >= max_acquisitions) {
                    throw;
                }
                driver_log->debug("[{}]: session is dead, retrying on a new session", s->id());
                backoff_and_count(state, e, std::string(), retry);
                force_new = true;
                continue;
            } catch (...) {
                release_session(s);
                throw;
            }
            release_session(s);
            return;
        }
    }

    std::shared_ptr<cursor> driver::list_tables()
    {
        auto rows = execute_lambda([](executor& ex) { return ex.execute_statement(TABLE_NAMES_QUERY); });
        std::vector<nlohmann::json> names;
        while (auto row = rows->next()) {
            if (row->is_object() && row->contains("name")) {
                names.push_back(row->at("name"));
            } else {
                names.push_back(*row);
            }
        }
        return std::make_shared<buffered_cursor>(std::move(names), rows->consumed_ios(), rows->timing());
    }

    void driver::close()
    {
        if (closed_.exchange(true)) {
            return;
        }
        driver_log->info("closing driver");
        pool_->close();
    }

    size_t driver::available_permits() const
    {
        return pool_->available();
    }

    size_t driver::idle_sessions() const
    {
        return pool_->size();
    }
} // namespace driver
} // namespace ledger
