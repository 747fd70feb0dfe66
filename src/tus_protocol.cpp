/*
 * Copyright 2018, alex at staticlibs.net
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "tus_protocol.hpp"

#include <limits>

namespace tusclient {
namespace protocol {

bool parse_offset(const std::string& str, uint64_t& out) {
    if (str.empty()) return false;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t res = 0;
    for (char ch : str) {
        if (ch < '0' || ch > '9') return false;
        uint64_t digit = static_cast<uint64_t>(ch - '0');
        if (res > (max - digit) / 10) return false;
        res = res * 10 + digit;
    }
    out = res;
    return true;
}

bool is_int_length(uint64_t length) {
    return length <= static_cast<uint64_t>(std::numeric_limits<int>::max());
}

} // namespace
}
