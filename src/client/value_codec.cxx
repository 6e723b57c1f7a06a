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

#include <ledger/client/value_codec.hxx>

#include <cstdint>
#include <vector>

std::string
ledger::value_codec::encode(const nlohmann::json& value)
{
    if (value.is_discarded()) {
        throw value_conversion_error("cannot encode a discarded value");
    }
    try {
        std::vector<std::uint8_t> bytes = nlohmann::json::to_cbor(value);
        return std::string(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw value_conversion_error(std::string("failed to encode value: ") + e.what());
    }
}

nlohmann::json
ledger::value_codec::decode(const std::string& bytes)
{
    try {
        return nlohmann::json::from_cbor(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw value_conversion_error(std::string("failed to decode value: ") + e.what());
    }
}
