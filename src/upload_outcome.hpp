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

#ifndef TUSCLIENT_UPLOAD_OUTCOME_HPP
#define TUSCLIENT_UPLOAD_OUTCOME_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace tusclient {

struct upload_session {
    std::string session_url;
    uint64_t total_size = 0;
    std::string filename;
};

struct transfer_cursor {
    uint64_t uploaded_bytes = 0;
    uint32_t retry_count = 0;
};

struct upload_callbacks {
    std::function<void(float)> on_progress;
    std::function<void(const std::string&)> on_success;
    std::function<void(const std::string&)> on_error;
};

/**
 * Terminal result of an upload: final session URL or a failure message
 */
class upload_outcome {
    bool succeeded;
    std::string text;

    upload_outcome(bool succeeded, std::string text) :
    succeeded(succeeded),
    text(std::move(text)) { }

public:
    static upload_outcome success(std::string session_url) {
        return upload_outcome(true, std::move(session_url));
    }

    static upload_outcome failure(std::string message) {
        return upload_outcome(false, std::move(message));
    }

    bool is_success() const {
        return succeeded;
    }

    // empty on failure
    std::string session_url() const {
        return succeeded ? text : std::string();
    }

    // empty on success
    std::string message() const {
        return succeeded ? std::string() : text;
    }
};

} // namespace

#endif /* TUSCLIENT_UPLOAD_OUTCOME_HPP */
