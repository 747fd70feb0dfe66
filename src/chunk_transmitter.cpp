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
 * File:   chunk_transmitter.cpp
 * Author: alex
 */

#include "chunk_transmitter.hpp"

#include "staticlib/support.hpp"

#include "wilton/support/exception.hpp"

#include "tus_protocol.hpp"

namespace tusclient {

chunk_transmitter::chunk_transmitter(transport& http) :
http(http) { }

step_result<uint64_t> chunk_transmitter::transmit(const std::string& session_url, const chunk_request& chunk) {
    if (nullptr == chunk.data && chunk.length > 0) throw wilton::support::exception(TRACEMSG(
            "Null chunk data specified, length: [" + sl::support::to_string(chunk.length) + "]"));
    auto req = http_request();
    req.method = "PATCH";
    req.url = session_url;
    req.headers.emplace_back(protocol::header_tus_resumable, protocol::version);
    req.headers.emplace_back(protocol::header_content_type, protocol::offset_content_type);
    req.headers.emplace_back(protocol::header_upload_offset, sl::support::to_string(chunk.offset));
    req.body = chunk.data;
    req.body_length = static_cast<size_t>(chunk.length);

    auto resp = http.send(req);
    if (!resp.connection_successful || 204 != resp.status_code) {
        auto msg = std::string("Chunk upload failed");
        if (!resp.error.empty()) {
            msg += ": " + resp.error;
        }
        return step_result<uint64_t>::fail(msg + " (HTTP " + sl::support::to_string(resp.status_code) + ")");
    }
    uint64_t new_offset = 0;
    if (!protocol::parse_offset(resp.header(protocol::header_upload_offset), new_offset)) {
        return step_result<uint64_t>::fail("Server did not return valid upload offset");
    }
    // server may accept a part of the chunk, but not nothing and never more than was sent
    if (new_offset <= chunk.offset || new_offset > chunk.offset + chunk.length) {
        return step_result<uint64_t>::fail("Server returned inconsistent upload offset: [" +
                sl::support::to_string(new_offset) + "], chunk offset: [" +
                sl::support::to_string(chunk.offset) + "], chunk length: [" +
                sl::support::to_string(chunk.length) + "]");
    }
    return step_result<uint64_t>::ok(new_offset);
}

} // namespace
