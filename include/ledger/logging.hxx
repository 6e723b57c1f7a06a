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

#include <spdlog/common.h>

namespace ledger
{
/**
 * @brief Log levels
 *
 * Log levels, in increasing order of verbosity.  Both the client and driver loggers accept
 * these.
 */
enum class log_level { OFF, CRITICAL, ERROR, WARN, INFO, DEBUG, TRACE };

/**
 * @brief Set log level for the endpoint and session pool plumbing.
 *
 * @param level Desired log level.
 */
void
set_client_log_level(log_level level);

/**
 * @brief Set log level for sessions, transactions, cursors and retry decisions.
 *
 * @param level Desired log level.
 */
void
set_driver_log_level(log_level level);

/**
 * @brief Send all driver and client logging to a sink of your own.
 *
 * Replaces the default stdout sinks of both loggers with @p sink, and sets both to @p level.
 *
 * @param level Desired log level.
 * @param sink Where the log records go.
 */
void
create_loggers(log_level level, spdlog::sink_ptr sink);
} // namespace ledger
