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

#include "transport.hpp"

#include <algorithm>
#include <cctype>

namespace tusclient {

namespace { // anonymous

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.length() != b.length()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) == std::tolower(static_cast<unsigned char>(cb));
    });
}

} // namespace

const std::string& http_reply::header(const std::string& name) const {
    static const std::string empty;
    for (auto& pa : headers) {
        if (equals_ignore_case(pa.first, name)) {
            return pa.second;
        }
    }
    return empty;
}

} // namespace
