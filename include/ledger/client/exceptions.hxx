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

#include <cstdint>
#include <stdexcept>
#include <string>

#include <ledger/support.hxx>

namespace ledger
{
/**
 * @brief An error returned by the ledger service.
 *
 * Thrown by @ref session_endpoint implementations.  The driver classifies these to decide
 * whether to retry, but always surfaces the original error to the application.
 */
class endpoint_error : public std::runtime_error
{
  private:
    std::string code_;
    std::string message_;
    uint32_t http_status_;

  public:
    /**
     * @param code Service error code, for instance "OccConflictException".
     * @param message Service error message, may be empty.
     * @param http_status HTTP status code of the response, 0 if no response was received.
     */
    endpoint_error(std::string code, std::string message, uint32_t http_status = 400);

    LEDGER_NODISCARD const std::string& code() const
    {
        return code_;
    }

    LEDGER_NODISCARD const std::string& message() const
    {
        return message_;
    }

    LEDGER_NODISCARD uint32_t http_status() const
    {
        return http_status_;
    }
};

/**
 * @brief A value could not be converted to or from its wire encoding.
 */
class value_conversion_error : public std::runtime_error
{
  public:
    explicit value_conversion_error(const std::string& what)
      : std::runtime_error(what)
    {
    }
};
} // namespace ledger
