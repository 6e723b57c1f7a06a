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

#include <ledger/client/exceptions.hxx>
#include <ledger/driver/exceptions.hxx>

namespace ledger
{
namespace driver
{
    enum error_class {
        FAIL_OCC_CONFLICT = 0,
        FAIL_INVALID_SESSION,
        FAIL_TRANSACTION_EXPIRED,
        FAIL_BAD_REQUEST,
        FAIL_TRANSIENT,
        FAIL_OTHER
    };

    // error codes sent by the service, or synthesized by the transport
    static const std::string OCC_CONFLICT_CODE("OccConflictException");
    static const std::string INVALID_SESSION_CODE("InvalidSessionException");
    static const std::string BAD_REQUEST_CODE("BadRequestException");
    static const std::string NO_HTTP_RESPONSE_CODE("NoHttpResponseException");
    static const std::string SOCKET_TIMEOUT_CODE("SocketTimeoutException");

    bool
    is_occ_conflict(const endpoint_error& err);

    bool
    is_invalid_session(const endpoint_error& err);

    /**
     * An invalid-session error whose message says the transaction expired.  The session itself
     * is still usable.
     */
    bool
    is_transaction_expired(const endpoint_error& err);

    bool
    is_bad_request(const endpoint_error& err);

    /**
     * HTTP 500 or 503, or a lost or timed out connection.
     */
    bool
    is_retriable_transport(const endpoint_error& err);

    error_class
    error_class_from_error(const endpoint_error& err);

    /**
     * Whether an error of this class may succeed if the lambda runs again.  A session the
     * service no longer knows is never retried.
     */
    bool
    is_retriable(error_class ec);
} // namespace driver
} // namespace ledger
