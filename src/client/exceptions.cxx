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

#include <ledger/client/exceptions.hxx>

#include <sstream>
#include <utility>

namespace
{
std::string
format_endpoint_error(const std::string& code, const std::string& message, uint32_t http_status)
{
    std::ostringstream os;
    os << code;
    if (!message.empty()) {
        os << ": " << message;
    }
    os << " (http status " << http_status << ")";
    return os.str();
}
} // namespace

ledger::endpoint_error::endpoint_error(std::string code, std::string message, uint32_t http_status)
  : std::runtime_error(format_endpoint_error(code, message, http_status))
  , code_(std::move(code))
  , message_(std::move(message))
  , http_status_(http_status)
{
}
