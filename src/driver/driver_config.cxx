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

#include <ledger/driver/driver_config.hxx>

namespace ledger
{
namespace driver
{
    static const std::chrono::milliseconds DEFAULT_POOL_TIMEOUT(30000);

    driver_config::driver_config()
      : driver_config(std::string())
    {
    }

    driver_config::driver_config(std::string ledger_name)
      : ledger_name_(std::move(ledger_name))
      , max_concurrent_transactions_(0)
      , pool_timeout_(DEFAULT_POOL_TIMEOUT)
      , read_ahead_(0)
    {
    }

    void driver_config::max_concurrent_transactions(int limit)
    {
        if (limit < 0) {
            throw std::invalid_argument("max concurrent transactions must not be negative");
        }
        max_concurrent_transactions_ = static_cast<size_t>(limit);
    }

    void driver_config::read_ahead(int pages)
    {
        if (pages < 0 || pages == 1) {
            throw std::invalid_argument("read ahead must be 0, or at least 2");
        }
        read_ahead_ = static_cast<size_t>(pages);
    }

    void
    from_json(const nlohmann::json& j, driver_config& config)
    {
        if (j.contains("ledger_name")) {
            config.ledger_name(j.at("ledger_name").get<std::string>());
        }
        if (j.contains("max_concurrent_transactions")) {
            config.max_concurrent_transactions(j.at("max_concurrent_transactions").get<int>());
        }
        if (j.contains("pool_timeout_ms")) {
            config.pool_timeout(std::chrono::milliseconds(j.at("pool_timeout_ms").get<int64_t>()));
        }
        if (j.contains("read_ahead")) {
            config.read_ahead(j.at("read_ahead").get<int>());
        }
        if (j.contains("retry_limit") || j.contains("retry_base_ms")) {
            int limit = j.value("retry_limit", static_cast<int>(config.retry().retry_limit()));
            auto base = std::chrono::milliseconds(j.value("retry_base_ms", static_cast<int64_t>(config.retry().base().count())));
            config.retry(retry_config(limit, base, config.retry().custom_backoff()));
        }
    }
} // namespace driver
} // namespace ledger
