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

#include "logging.hxx"

namespace ledger
{
namespace driver
{
    std::shared_ptr<spdlog::logger> init_driver_log()
    {
        static std::shared_ptr<spdlog::logger> logger = [] {
            auto existing = spdlog::get(DRIVER_LOGGER);
            if (existing) {
                return existing;
            }
            auto created = spdlog::stdout_logger_mt(DRIVER_LOGGER);
            created->set_pattern(LOGGER_PATTERN);
            return created;
        }();
        return logger;
    }
} // namespace driver

void
set_driver_log_level(log_level level)
{
    driver::init_driver_log()->set_level(ledger_to_spdlog_level(level));
}

void
create_loggers(log_level level, spdlog::sink_ptr sink)
{
    auto lvl = ledger_to_spdlog_level(level);
    for (auto& logger : { init_client_logger(), driver::init_driver_log() }) {
        logger->flush();
        logger->sinks().clear();
        logger->sinks().push_back(sink);
        logger->set_pattern(LOGGER_PATTERN);
        logger->set_level(lvl);
    }
}

} // namespace ledger
