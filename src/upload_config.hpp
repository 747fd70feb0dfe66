/*
 * Copyright 2018, alex at staticlibs.net
 * Copyright 2018, mike at myasnikov.mike@gmail.com
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

#ifndef TUSCLIENT_UPLOAD_CONFIG_HPP
#define TUSCLIENT_UPLOAD_CONFIG_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "staticlib/http.hpp"
#include "staticlib/json.hpp"

#include "wilton/support/exception.hpp"

#include "tus_protocol.hpp"

namespace tusclient {

struct upload_options {
    std::string url = protocol::default_endpoint;
    uint64_t chunk_size = protocol::default_chunk_size;
    uint32_t max_retries = protocol::default_max_retries;
    uint32_t backoff_step_millis = protocol::default_backoff_step_millis;
    // additional Upload-Metadata pairs, "filename" is always sent
    std::vector<std::pair<std::string, std::string>> metadata;
};

class upload_config {
public:
    upload_options options;
    sl::http::request_options request_options;
    bool use_multi_threaded_session = false;

    upload_config() { }

    upload_config(const sl::json::value& json) {
        for (const sl::json::field& fi : json.as_object()) {
            auto& name = fi.name();
            if ("url" == name) {
                options.url = fi.as_string_nonempty_or_throw(name);
            } else if ("chunkSizeBytes" == name) {
                options.chunk_size = fi.as_uint32_positive_or_throw(name);
            } else if ("maxRetries" == name) {
                options.max_retries = fi.as_uint32_positive_or_throw(name);
            } else if ("backoffStepMillis" == name) {
                options.backoff_step_millis = fi.as_uint32_or_throw(name);
            } else if ("multiThreaded" == name) {
                use_multi_threaded_session = fi.as_bool_or_throw(name);
            } else if ("metadata" == name) {
                for (const sl::json::field& mf : fi.as_object_or_throw(name)) {
                    if ("filename" == mf.name()) throw wilton::support::exception(TRACEMSG(
                            "Reserved 'metadata' field: [filename]"));
                    std::string val = mf.as_string_or_throw(mf.name());
                    options.metadata.emplace_back(mf.name(), std::move(val));
                }
            } else if ("request" == name) {
                apply_request_options(fi.as_object_or_throw(name));
            } else {
                throw wilton::support::exception(TRACEMSG("Unknown 'upload_config' field: [" + name + "]"));
            }
        }
    }

private:
    void apply_request_options(const std::vector<sl::json::field>& fields) {
        for (const sl::json::field& fi : fields) {
            auto& name = fi.name();
            if ("headers" == name) {
                for (const sl::json::field& hf : fi.as_object_or_throw(name)) {
                    std::string val = hf.as_string_nonempty_or_throw(hf.name());
                    request_options.headers.emplace_back(hf.name(), std::move(val));
                }
            } else if ("timeoutMillis" == name) {
                request_options.timeout_millis = fi.as_uint32_positive_or_throw(name);
            } else if ("connecttimeoutMillis" == name) {
                request_options.connecttimeout_millis = fi.as_uint32_positive_or_throw(name);
            } else if ("tcpKeepalive" == name) {
                request_options.tcp_keepalive = fi.as_bool_or_throw(name);
            } else if ("useragent" == name) {
                request_options.useragent = fi.as_string_nonempty_or_throw(name);
            } else if ("maxSentSpeedLargeBytesPerSecond" == name) {
                request_options.max_sent_speed_large_bytes_per_second = fi.as_uint32_or_throw(name);
            } else if ("sslVerifyhost" == name) {
                request_options.ssl_verifyhost = fi.as_bool_or_throw(name);
            } else if ("sslVerifypeer" == name) {
                request_options.ssl_verifypeer = fi.as_bool_or_throw(name);
            } else if ("cainfoFilename" == name) {
                request_options.cainfo_filename = fi.as_string_nonempty_or_throw(name);
            } else {
                throw wilton::support::exception(TRACEMSG("Unknown 'request' field: [" + name + "]"));
            }
        }
    }
};

} // namespace

#endif /* TUSCLIENT_UPLOAD_CONFIG_HPP */
