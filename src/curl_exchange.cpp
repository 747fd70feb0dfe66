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
 * File:   curl_exchange.cpp
 * Author: alex
 */

#include "curl_exchange.hpp"

#include <array>
#include <memory>

#include <curl/curl.h>

#include "staticlib/support.hpp"

#include "wilton/support/exception.hpp"

namespace tusclient {

namespace { // anonymous

struct exchange_state {
    header_list headers;
    std::string body;
};

size_t write_body(char* buffer, size_t size, size_t nitems, void* userp) {
    auto state = static_cast<exchange_state*> (userp);
    size_t len = size * nitems;
    state->body.append(buffer, len);
    return len;
}

size_t write_header(char* buffer, size_t size, size_t nitems, void* userp) {
    auto state = static_cast<exchange_state*> (userp);
    size_t len = size * nitems;
    auto line = std::string(buffer, len);
    while (!line.empty() && ('\r' == line.back() || '\n' == line.back())) {
        line.pop_back();
    }
    // status line of an interim or redirect response starts a new header set
    if (0 == line.find("HTTP/")) {
        state->headers.clear();
        return len;
    }
    auto colon = line.find(':');
    if (std::string::npos == colon) {
        return len;
    }
    auto value_start = line.find_first_not_of(" \t", colon + 1);
    auto value = std::string::npos != value_start ? line.substr(value_start) : std::string();
    state->headers.emplace_back(line.substr(0, colon), std::move(value));
    return len;
}

template<typename T>
void setopt(CURL* curl, CURLoption opt, T value) {
    CURLcode code = curl_easy_setopt(curl, opt, value);
    if (CURLE_OK != code) throw wilton::support::exception(TRACEMSG(
            "Error setting curl option: [" + sl::support::to_string(static_cast<int>(opt)) + "]," +
            " message: [" + curl_easy_strerror(code) + "]"));
}

void apply_options(CURL* curl, const sl::http::request_options& options) {
    setopt(curl, CURLOPT_NOSIGNAL, 1L);
    setopt(curl, CURLOPT_TCP_KEEPALIVE, options.tcp_keepalive ? 1L : 0L);
    if (options.timeout_millis > 0) {
        setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_millis));
    }
    if (options.connecttimeout_millis > 0) {
        setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connecttimeout_millis));
    }
    if (options.max_sent_speed_large_bytes_per_second > 0) {
        setopt(curl, CURLOPT_MAX_SEND_SPEED_LARGE,
                static_cast<curl_off_t>(options.max_sent_speed_large_bytes_per_second));
    }
    if (!options.useragent.empty()) {
        setopt(curl, CURLOPT_USERAGENT, options.useragent.c_str());
    }
    setopt(curl, CURLOPT_SSL_VERIFYHOST, options.ssl_verifyhost ? 2L : 0L);
    setopt(curl, CURLOPT_SSL_VERIFYPEER, options.ssl_verifypeer ? 1L : 0L);
    if (!options.cainfo_filename.empty()) {
        setopt(curl, CURLOPT_CAINFO, options.cainfo_filename.c_str());
    }
}

} // namespace

bool curl_exchange::is_supported_method(const std::string& method) {
    return "HEAD" == method || "PATCH" == method;
}

http_reply curl_exchange::perform(const http_request& req, const sl::http::request_options& options) {
    if (!is_supported_method(req.method)) throw wilton::support::exception(TRACEMSG(
            "Unsupported method: [" + req.method + "]"));
    auto curl = std::unique_ptr<CURL, void(*)(CURL*)>(curl_easy_init(), curl_easy_cleanup);
    if (nullptr == curl.get()) throw wilton::support::exception(TRACEMSG("Error initializing curl handle"));
    auto headers = std::unique_ptr<curl_slist, void(*)(curl_slist*)>(nullptr, curl_slist_free_all);
    auto append_header = [&headers](const std::string& line) {
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (nullptr == appended) throw wilton::support::exception(TRACEMSG(
                "Error appending request header: [" + line + "]"));
        headers.release();
        headers.reset(appended);
    };
    for (auto& pa : options.headers) {
        append_header(pa.first + ": " + pa.second);
    }
    for (auto& pa : req.headers) {
        append_header(pa.first + ": " + pa.second);
    }

    auto state = exchange_state();
    auto errbuf = std::array<char, CURL_ERROR_SIZE>();
    errbuf[0] = '\0';
    apply_options(curl.get(), options);
    setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf.data());
    setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
    setopt(curl.get(), CURLOPT_HEADERDATA, static_cast<void*>(std::addressof(state)));
    setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(std::addressof(state)));
    if ("HEAD" == req.method) {
        // response to HEAD carries no body
        setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else {
        // no 'Expect: 100-continue' round trip before each chunk
        append_header("Expect:");
        setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
        setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_length));
        setopt(curl.get(), CURLOPT_POSTFIELDS, req.body_length > 0 ? req.body : "");
    }
    setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    auto reply = http_reply();
    CURLcode code = curl_easy_perform(curl.get());
    if (CURLE_OK != code) {
        reply.connection_successful = false;
        reply.error = '\0' != errbuf[0] ? std::string(errbuf.data()) : std::string(curl_easy_strerror(code));
        return reply;
    }
    long status = 0;
    if (CURLE_OK != curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, std::addressof(status))) {
        reply.connection_successful = false;
        reply.error = "Error reading response code";
        return reply;
    }
    reply.connection_successful = true;
    reply.status_code = static_cast<uint16_t>(status);
    reply.headers = std::move(state.headers);
    reply.body = std::move(state.body);
    return reply;
}

} // namespace
