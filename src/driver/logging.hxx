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
#include "../client/logging.hxx"

#define DRIVER_LOGGER "ledger_driver"

namespace ledger
{
namespace driver
{
    std::shared_ptr<spdlog::logger> init_driver_log();

    static std::shared_ptr<spdlog::logger> driver_log = init_driver_log();
} // namespace driver
} // namespace ledger
