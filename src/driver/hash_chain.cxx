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

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <openssl/evp.h>

#include <ledger/client/value_codec.hxx>

#include "hash_chain.hxx"

namespace ledger
{
namespace driver
{
    static std::string
    sha256(const std::string& data)
    {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 || EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
            throw std::runtime_error("unable to compute SHA-256 digest");
        }
        return std::string(reinterpret_cast<const char*>(digest), length);
    }

    ledger_hash::ledger_hash(std::string bytes)
      : bytes_(std::move(bytes))
    {
        if (!bytes_.empty() && bytes_.size() != HASH_SIZE) {
            throw std::invalid_argument("hash must be empty or " + std::to_string(HASH_SIZE) + " bytes, got " +
                                        std::to_string(bytes_.size()));
        }
    }

    ledger_hash
    ledger_hash::of(const nlohmann::json& value)
    {
        return of_encoded(value_codec::encode(value));
    }

    ledger_hash
    ledger_hash::of_encoded(const std::string& encoded)
    {
        return ledger_hash(sha256(encoded));
    }

    ledger_hash
    ledger_hash::dot(const ledger_hash& other) const
    {
        if (is_empty()) {
            return other;
        }
        if (other.is_empty()) {
            return *this;
        }
        if (hash_comparator(bytes_, other.bytes_) < 0) {
            return ledger_hash(sha256(bytes_ + other.bytes_));
        }
        return ledger_hash(sha256(other.bytes_ + bytes_));
    }

    std::string
    ledger_hash::to_hex() const
    {
        std::ostringstream os;
        os << std::hex << std::setfill('0');
        for (unsigned char c : bytes_) {
            os << std::setw(2) << static_cast<int>(c);
        }
        return os.str();
    }

    int
    hash_comparator(const std::string& a, const std::string& b)
    {
        if (a.size() != HASH_SIZE || b.size() != HASH_SIZE) {
            throw std::invalid_argument("hashes must be " + std::to_string(HASH_SIZE) + " bytes to be compared");
        }
        for (size_t i = HASH_SIZE; i-- > 0;) {
            auto left = static_cast<signed char>(a[i]);
            auto right = static_cast<signed char>(b[i]);
            if (left != right) {
                return left - right;
            }
        }
        return 0;
    }

    ledger_hash
    statement_hash(const std::string& statement, const std::vector<std::string>& encoded_parameters)
    {
        auto hash = ledger_hash::of(nlohmann::json(statement));
        for (const auto& param : encoded_parameters) {
            hash = hash.dot(ledger_hash::of_encoded(param));
        }
        return hash;
    }
} // namespace driver
} // namespace ledger
