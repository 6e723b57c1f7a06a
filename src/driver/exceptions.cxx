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

#include <regex>

#include "exceptions_internal.hxx"

namespace ledger
{
namespace driver
{
    bool
    is_occ_conflict(const endpoint_error& err)
    {
        return err.code() == OCC_CONFLICT_CODE;
    }

    bool
    is_invalid_session(const endpoint_error& err)
    {
        return err.code() == INVALID_SESSION_CODE;
    }

    bool
    is_transaction_expired(const endpoint_error& err)
    {
        static const std::regex expired_pattern("Transaction .* has expired");
        return is_invalid_session(err) && std::regex_search(err.message(), expired_pattern);
    }

    bool
    is_bad_request(const endpoint_error& err)
    {
        return err.code() == BAD_REQUEST_CODE;
    }

    bool
    is_retriable_transport(const endpoint_error& err)
    {
        return err.http_status() == 500 || err.http_status() == 503 || err.code() == NO_HTTP_RESPONSE_CODE ||
               err.code() == SOCKET_TIMEOUT_CODE;
    }

    error_class
    error_class_from_error(const endpoint_error& err)
    {
        if (is_occ_conflict(err)) {
            return FAIL_OCC_CONFLICT;
        }
        if (is_transaction_expired(err)) {
            return FAIL_TRANSACTION_EXPIRED;
        }
        if (is_invalid_session(err)) {
            return FAIL_INVALID_SESSION;
        }
        if (is_retriable_transport(err)) {
            return FAIL_TRANSIENT;
        }
        if (is_bad_request(err)) {
            return FAIL_BAD_REQUEST;
        }
        return FAIL_OTHER;
    }

    bool
    is_retriable(error_class ec)
    {
        switch (ec) {
            case FAIL_OCC_CONFLICT:
            case FAIL_TRANSACTION_EXPIRED:
            case FAIL_TRANSIENT:
                return true;
            default:
                return false;
        }
    }
} // namespace driver
} // namespace ledger
