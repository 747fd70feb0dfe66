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

/* 
 * File:   error_body.cpp
 * Author: alex
 */

#include "error_body.hpp"

#include <iterator>

#include "utf8.h"

#include "staticlib/json.hpp"

namespace tusclient {

namespace { // anonymous

bool looks_like_object(const std::string& body) {
    for (char ch : body) {
        switch (ch) {
        case ' ': case '\t': case '\r': case '\n':
            continue;
        default:
            return '{' == ch;
        }
    }
    return false;
}

std::string to_valid_utf8(const std::string& str) {
    if (utf8::is_valid(str.begin(), str.end())) {
        return str;
    }
    auto res = std::string();
    utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(res));
    return res;
}

} // namespace

error_body::error_body(kind body_kind, std::string text) :
body_kind(body_kind),
text(std::move(text)) { }

error_body error_body::decode(const std::string& body) {
    if (body.empty()) {
        return error_body(kind::empty, "");
    }
    if (!looks_like_object(body)) {
        return error_body(kind::raw, to_valid_utf8(body));
    }
    auto json = sl::json::value();
    try {
        json = sl::json::loads(body);
    } catch (const std::exception&) {
        // loads is the only parse API, malformed object is a raw body
        return error_body(kind::raw, to_valid_utf8(body));
    }
    for (const sl::json::field& fi : json.as_object()) {
        if ("error" == fi.name() && sl::json::type::string == fi.val().json_type()) {
            auto& msg = fi.as_string();
            if (!msg.empty()) {
                return error_body(kind::parsed, msg);
            }
        }
    }
    return error_body(kind::empty, "");
}

std::string error_body::to_message(const std::string& fallback) const {
    switch (body_kind) {
    case kind::parsed:
    case kind::raw:
        return text;
    default:
        return fallback;
    }
}

} // namespace
