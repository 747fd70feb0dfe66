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

#ifndef TUSCLIENT_CHUNK_TRANSMITTER_HPP
#define TUSCLIENT_CHUNK_TRANSMITTER_HPP

#include <cstdint>
#include <string>

#include "step_result.hpp"
#include "transport.hpp"

namespace tusclient {

struct chunk_request {
    uint64_t offset = 0;
    // points into the caller's file buffer
    const char* data = nullptr;
    uint64_t length = 0;
};

class chunk_transmitter {
    transport& http;

public:
    explicit chunk_transmitter(transport& http);

    /**
     * Sends one chunk with PATCH, the offset reported back by the server
     * becomes the new cursor position
     * 
     * @param session_url upload URL returned on creation
     * @param chunk bytes to send and the offset they start at
     * @return server-reported offset, failure message otherwise
     */
    step_result<uint64_t> transmit(const std::string& session_url, const chunk_request& chunk);
};

} // namespace

#endif /* TUSCLIENT_CHUNK_TRANSMITTER_HPP */
