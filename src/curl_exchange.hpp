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

#ifndef TUSCLIENT_CURL_EXCHANGE_HPP
#define TUSCLIENT_CURL_EXCHANGE_HPP

#include "staticlib/http.hpp"

#include "transport.hpp"

namespace tusclient {

/**
 * Performs requests that 'sl::http::session' does not support
 * ('HEAD' and 'PATCH') on a libcurl easy handle. Uses the same
 * request options as the session, network errors are reported
 * in the reply.
 */
class curl_exchange {
public:
    static bool is_supported_method(const std::string& method);

    static http_reply perform(const http_request& req, const sl::http::request_options& options);
};

} // namespace

#endif /* TUSCLIENT_CURL_EXCHANGE_HPP */
