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
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <ledger/support.hxx>

/**
 * @file
 * The boundary between the driver and the transport that talks to the ledger service.
 */
namespace ledger
{
/**
 * @brief IO consumed by a statement, as reported by the service.
 */
struct io_usage {
    int64_t read_ios{ 0 };
    int64_t write_ios{ 0 };
};

/**
 * @brief Server side processing time of a statement, as reported by the service.
 */
struct timing_information {
    int64_t processing_time_milliseconds{ 0 };
};

/**
 * @brief One page of a statement result.
 *
 * Each value is the wire encoding of one row, see @ref value_codec.  A page without a
 * next_page_token is the last page of the result.
 */
struct page {
    std::vector<std::string> values;
    boost::optional<std::string> next_page_token;
};

struct start_session_result {
    std::string session_token;
    std::string session_id;
};

struct start_transaction_result {
    std::string transaction_id;
};

struct execute_statement_result {
    page first_page;
    boost::optional<io_usage> consumed_ios;
    boost::optional<timing_information> timing;
};

struct fetch_page_result {
    page current_page;
    boost::optional<io_usage> consumed_ios;
    boost::optional<timing_information> timing;
};

struct commit_transaction_result {
    std::string transaction_id;
    /** @brief digest computed by the service, 32 bytes */
    std::string commit_digest;
};

/**
 * @brief Transport for a session oriented ledger service.
 *
 * The driver never speaks the wire protocol itself, it calls one of these.  All calls are
 * blocking.  Implementations must tolerate concurrent calls from different threads: every
 * checked-out session issues its own calls, and read-ahead cursors fetch pages from a
 * background thread.
 *
 * Remote failures are reported by throwing @ref endpoint_error.
 */
class session_endpoint
{
  public:
    virtual ~session_endpoint() = default;

    /**
     * @brief Maximum number of concurrent requests the transport supports.
     *
     * The driver refuses a pool limit larger than this, and uses it as the pool limit when
     * none was configured.
     */
    LEDGER_NODISCARD virtual size_t max_connections() const = 0;

    virtual start_session_result start_session(const std::string& ledger_name) = 0;

    virtual start_transaction_result start_transaction(const std::string& session_token) = 0;

    virtual execute_statement_result execute_statement(const std::string& session_token,
                                                       const std::string& transaction_id,
                                                       const std::string& statement,
                                                       const std::vector<std::string>& parameters) = 0;

    virtual fetch_page_result fetch_page(const std::string& session_token,
                                         const std::string& transaction_id,
                                         const std::string& next_page_token) = 0;

    virtual commit_transaction_result commit_transaction(const std::string& session_token,
                                                         const std::string& transaction_id,
                                                         const std::string& commit_digest) = 0;

    virtual void abort_transaction(const std::string& session_token) = 0;

    virtual void end_session(const std::string& session_token) = 0;
};
} // namespace ledger
