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

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <ledger/support.hxx>

namespace ledger
{
namespace driver
{
    static const size_t HASH_SIZE = 32;

    /**
     * A SHA-256 hash, or the empty hash which is the identity of @ref dot.
     */
    class ledger_hash
    {
      public:
        ledger_hash() = default;

        /**
         * @throws std::invalid_argument unless bytes is empty or exactly HASH_SIZE long.
         */
        explicit ledger_hash(std::string bytes);

        /**
         * Hash of the wire encoding of a value.
         */
        static ledger_hash of(const nlohmann::json& value);

        /**
         * Hash of a value that is already wire encoded.
         */
        static ledger_hash of_encoded(const std::string& encoded);

        /**
         * Commutative combination of two hashes.  The smaller hash, comparing signed bytes from
         * the last byte down, is placed first and the 64 bytes are hashed again.
         */
        LEDGER_NODISCARD ledger_hash dot(const ledger_hash& other) const;

        LEDGER_NODISCARD bool is_empty() const
        {
            return bytes_.empty();
        }

        LEDGER_NODISCARD const std::string& bytes() const
        {
            return bytes_;
        }

        LEDGER_NODISCARD std::string to_hex() const;

        bool operator==(const ledger_hash& other) const
        {
            return bytes_ == other.bytes_;
        }

        bool operator!=(const ledger_hash& other) const
        {
            return !(*this == other);
        }

      private:
        std::string bytes_;
    };

    /**
     * Orders two HASH_SIZE byte strings, comparing signed bytes from the last byte down.
     * Returns a negative, zero or positive value like strcmp.
     */
    int
    hash_comparator(const std::string& a, const std::string& b);

    /**
     * Hash of one statement: the statement text combined with each encoded parameter in order.
     */
    ledger_hash
    statement_hash(const std::string& statement, const std::vector<std::string>& encoded_parameters);
} // namespace driver
} // namespace ledger
