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
 * File:   transport.hpp
 * Author: alex
 */

#ifndef TUSCLIENT_TRANSPORT_HPP
#define TUSCLIENT_TRANSPORT_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tusclient {

using header_list = std::vector<std::pair<std::string, std::string>>;

struct http_request {
    std::string method;
    std::string url;
    header_list headers;
    // not owned, must outlive the send call
    const char* body = nullptr;
    size_t body_length = 0;
};

struct http_reply {
    bool connection_successful = false;
    std::string error;
    uint16_t status_code = 0;
    header_list headers;
    std::string body;

    /**
     * Case-insensitive header lookup
     * 
     * @param name header name
     * @return header value, empty string if header is not present
     */
    const std::string& header(const std::string& name) const;
};

/**
 * Performs a single blocking HTTP exchange. Implementations must not throw
 * on network errors, such errors are reported through 'connection_successful'
 * and 'error' fields of the reply.
 */
class transport {
public:
    virtual ~transport() { }

    virtual http_reply send(const http_request& req) = 0;
};

} // namespace

#endif /* TUSCLIENT_TRANSPORT_HPP */
