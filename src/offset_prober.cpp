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

#include "offset_prober.hpp"

#include "staticlib/support.hpp"

#include "tus_protocol.hpp"

namespace tusclient {

offset_prober::offset_prober(transport& http) :
http(http) { }

step_result<uint64_t> offset_prober::probe(const std::string& session_url) {
    auto req = http_request();
    req.method = "HEAD";
    req.url = session_url;
    req.headers.emplace_back(protocol::header_tus_resumable, protocol::version);

    auto resp = http.send(req);
    if (!resp.connection_successful || resp.status_code < 200 || resp.status_code >= 300) {
        auto msg = std::string("Failed to check upload offset");
        if (!resp.error.empty()) {
            msg += ": " + resp.error;
        }
        return step_result<uint64_t>::fail(msg + " (HTTP " + sl::support::to_string(resp.status_code) + ")");
    }
    uint64_t offset = 0;
    if (!protocol::parse_offset(resp.header(protocol::header_upload_offset), offset)) {
        return step_result<uint64_t>::fail("Invalid upload offset from server");
    }
    return step_result<uint64_t>::ok(offset);
}

} // namespace
