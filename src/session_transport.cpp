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
 * File:   session_transport.cpp
 * Author: alex
 */

#include "session_transport.hpp"

#include "curl_exchange.hpp"

#include "staticlib/io.hpp"
#include "staticlib/support.hpp"

#include "wilton/support/logging.hpp"

namespace tusclient {

namespace { // anonymous

const std::string logger = std::string("tusclient.transport");

} // namespace

session_transport::session_transport(sl::http::session& http, sl::http::request_options base_options) :
http(http),
base_options(std::move(base_options)) { }

http_reply session_transport::send(const http_request& req) {
    wilton::support::log_debug(logger, "Performing HTTP request, method: [" + req.method + "]," +
            " URL: [" + req.url + "], body length: [" + sl::support::to_string(req.body_length) + "] ...");
    auto reply = curl_exchange::is_supported_method(req.method) ?
            send_with_curl(req) : send_with_session(req);
    wilton::support::log_debug(logger, "HTTP request complete, status code: [" +
            sl::support::to_string(reply.status_code) + "]");
    return reply;
}

http_reply session_transport::send_with_curl(const http_request& req) {
    try {
        return curl_exchange::perform(req, base_options);
    } catch (const std::exception& e) {
        auto reply = http_reply();
        reply.connection_successful = false;
        reply.error = e.what();
        return reply;
    }
}

http_reply session_transport::send_with_session(const http_request& req) {
    auto opts = base_options;
    opts.method = req.method;
    // status codes are interpreted by the caller
    opts.abort_on_response_error = false;
    opts.abort_on_connect_error = true;
    for (auto& pa : req.headers) {
        opts.headers.emplace_back(pa.first, pa.second);
    }
    auto reply = http_reply();
    try {
        sl::http::resource resp = [&] {
            if (req.body_length > 0) {
                auto data_src = sl::io::array_source(req.body, req.body_length);
                // do not use chunked transfer, as length is known
                opts.send_request_body_content_length = true;
                opts.request_body_content_length = static_cast<uint32_t>(req.body_length);
                return http.open_url(req.url, std::move(data_src), opts);
            } else {
                return http.open_url(req.url, opts);
            }
        }();
        auto dest = sl::io::string_sink();
        sl::io::copy_all(resp, dest);
        reply.connection_successful = resp.connection_successful();
        reply.status_code = static_cast<uint16_t>(resp.get_status_code());
        reply.headers = resp.get_headers();
        reply.body = std::move(dest.get_string());
        if (!reply.connection_successful) {
            reply.error = "Connection failed";
        }
    } catch (const std::exception& e) {
        reply.connection_successful = false;
        reply.error = e.what();
    }
    return reply;
}

} // namespace
