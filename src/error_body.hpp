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

#ifndef TUSCLIENT_ERROR_BODY_HPP
#define TUSCLIENT_ERROR_BODY_HPP

#include <string>

namespace tusclient {

/**
 * Server error response body, either a JSON object with
 * an "error" field, a raw text or nothing usable
 */
class error_body {
public:
    enum class kind {
        parsed, raw, empty
    };

private:
    kind body_kind;
    std::string text;

    error_body(kind body_kind, std::string text);

public:
    static error_body decode(const std::string& body);

    kind get_kind() const {
        return body_kind;
    }

    const std::string& get_text() const {
        return text;
    }

    std::string to_message(const std::string& fallback) const;
};

} // namespace

#endif /* TUSCLIENT_ERROR_BODY_HPP */
