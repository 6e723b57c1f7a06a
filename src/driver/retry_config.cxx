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

#include <ledger/driver/retry_config.hxx>

namespace ledger
{
namespace driver
{
    retry_config::retry_config(int retry_limit, std::chrono::milliseconds base, backoff_fn custom_backoff)
      : retry_limit_(0)
      , base_(base)
      , custom_backoff_(std::move(custom_backoff))
    {
        if (retry_limit < 0) {
            throw std::invalid_argument("retry limit must not be negative");
        }
        if (base.count() < 0) {
            throw std::invalid_argument("base backoff must not be negative");
        }
        retry_limit_ = static_cast<uint32_t>(retry_limit);
    }
} // namespace driver
} // namespace ledger
