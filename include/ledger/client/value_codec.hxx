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

#include <string>

#include <ledger/client/exceptions.hxx>
#include <ledger/support.hxx>
#include <nlohmann/json.hpp>

namespace ledger
{
/**
 * @brief Converts values to and from the encoding used on the wire.
 *
 * Values are nlohmann::json.  The wire form is CBOR, which for a given value is always the
 * same sequence of bytes (object members are kept sorted by key), so it is also the input
 * to the commit digest.
 */
class value_codec
{
  public:
    /**
     * @brief Encode a value.
     *
     * @throws value_conversion_error if the value has no wire encoding.
     */
    LEDGER_NODISCARD static std::string encode(const nlohmann::json& value);

    /**
     * @brief Decode a value previously produced by @ref encode, or returned by the service.
     *
     * @throws value_conversion_error if the bytes are not a valid encoding.
     */
    LEDGER_NODISCARD static nlohmann::json decode(const std::string& bytes);

    /**
     * @brief Convert an application value into a json value.
     *
     * Anything with a to_json customization (see nlohmann::json) is accepted.
     *
     * @throws value_conversion_error if the conversion fails.
     */
    template<typename T>
    static nlohmann::json to_value(const T& content)
    {
        try {
            nlohmann::json value = content;
            return value;
        } catch (const std::exception& e) {
            throw value_conversion_error(std::string("failed to convert parameter: ") + e.what());
        }
    }
};
} // namespace ledger
