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

#ifndef TUSCLIENT_SESSION_TRANSPORT_HPP
#define TUSCLIENT_SESSION_TRANSPORT_HPP

#include "staticlib/http.hpp"

#include "transport.hpp"

namespace tusclient {

/**
 * Sends 'POST' requests through the 'sl::http::session',
 * 'HEAD' and 'PATCH' requests go through 'curl_exchange'
 * with the same request options.
 */
class session_transport : public transport {
    sl::http::session& http;
    sl::http::request_options base_options;

public:
    session_transport(sl::http::session& http, sl::http::request_options base_options);

    http_reply send(const http_request& req) override;

private:
    http_reply send_with_curl(const http_request& req);

    http_reply send_with_session(const http_request& req);
};

} // namespace

#endif /* TUSCLIENT_SESSION_TRANSPORT_HPP */
