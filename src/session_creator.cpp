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
 * File:   session_creator.cpp
 * Author: alex
 */

#include "session_creator.hpp"

#include <vector>

#include <openssl/evp.h>

#include "staticlib/support.hpp"

#include "wilton/support/exception.hpp"
#include "wilton/support/logging.hpp"

#include "error_body.hpp"
#include "tus_protocol.hpp"

namespace tusclient {

namespace { // anonymous

const std::string logger = std::string("tusclient.upload");

const std::string creation_failed_msg = "Upload creation failed";

std::string with_status(const std::string& msg, uint16_t status_code) {
    return msg + " (HTTP " + sl::support::to_string(status_code) + ")";
}

} // namespace

session_creator::session_creator(transport& http, std::string endpoint,
        std::vector<std::pair<std::string, std::string>> metadata) :
http(http),
endpoint(std::move(endpoint)),
metadata(std::move(metadata)) {
    if (this->endpoint.empty()) throw wilton::support::exception(TRACEMSG(
            "Invalid empty upload endpoint URL specified"));
}

step_result<std::string> session_creator::create(uint64_t file_size, const std::string& filename) {
    auto req = http_request();
    req.method = "POST";
    req.url = endpoint;
    req.headers.emplace_back(protocol::header_tus_resumable, protocol::version);
    req.headers.emplace_back(protocol::header_upload_length, sl::support::to_string(file_size));
    req.headers.emplace_back(protocol::header_upload_metadata, metadata_header(filename));

    wilton::support::log_debug(logger, "Creating upload session, URL: [" + endpoint + "]," +
            " length: [" + sl::support::to_string(file_size) + "], file: [" + filename + "] ...");
    auto resp = http.send(req);

    if (resp.connection_successful && 201 == resp.status_code) {
        auto& location = resp.header(protocol::header_location);
        if (location.empty()) {
            return step_result<std::string>::fail(with_status(
                    "Server did not return upload location", resp.status_code));
        }
        return step_result<std::string>::ok(resolve_location(endpoint, location));
    }

    auto fallback = creation_failed_msg;
    if (!resp.connection_successful && !resp.error.empty()) {
        fallback += ": " + resp.error;
    }
    auto msg = error_body::decode(resp.body).to_message(fallback);
    return step_result<std::string>::fail(with_status(msg, resp.status_code));
}

std::string session_creator::encode_base64(const std::string& str) {
    if (str.empty()) return std::string();
    auto buf = std::vector<unsigned char>(4 * ((str.length() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(str.data()),
            static_cast<int>(str.length()));
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(len));
}

std::string session_creator::resolve_location(const std::string& endpoint, const std::string& location) {
    if (location.empty() || '/' != location.front() || 0 == location.find("//")) {
        return location;
    }
    auto scheme_end = endpoint.find("://");
    if (std::string::npos == scheme_end) {
        return location;
    }
    auto path_start = endpoint.find('/', scheme_end + 3);
    return endpoint.substr(0, path_start) + location;
}

std::string session_creator::metadata_header(const std::string& filename) const {
    auto res = std::string("filename ") + encode_base64(filename);
    for (auto& pa : metadata) {
        res += "," + pa.first;
        if (!pa.second.empty()) {
            res += " " + encode_base64(pa.second);
        }
    }
    return res;
}

} // namespace
