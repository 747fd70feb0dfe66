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

#ifndef TUSCLIENT_SESSION_CREATOR_HPP
#define TUSCLIENT_SESSION_CREATOR_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "step_result.hpp"
#include "transport.hpp"

namespace tusclient {

class session_creator {
    transport& http;
    std::string endpoint;
    std::vector<std::pair<std::string, std::string>> metadata;

public:
    session_creator(transport& http, std::string endpoint,
            std::vector<std::pair<std::string, std::string>> metadata);

    /**
     * Issues a single creation request, no retries
     * 
     * @param file_size total upload length in bytes
     * @param filename file name, sent base64-encoded as metadata
     * @return session URL on success, failure message with HTTP status otherwise
     */
    step_result<std::string> create(uint64_t file_size, const std::string& filename);

    static std::string encode_base64(const std::string& str);

    static std::string resolve_location(const std::string& endpoint, const std::string& location);

private:
    std::string metadata_header(const std::string& filename) const;
};

} // namespace

#endif /* TUSCLIENT_SESSION_CREATOR_HPP */
