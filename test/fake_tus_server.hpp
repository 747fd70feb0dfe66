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

#ifndef TUSCLIENT_TEST_FAKE_TUS_SERVER_HPP
#define TUSCLIENT_TEST_FAKE_TUS_SERVER_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "staticlib/support.hpp"

#include "transport.hpp"
#include "tus_protocol.hpp"

namespace tusclient {
namespace testing {

class mock_transport : public transport {
public:
    MOCK_METHOD1(send, http_reply(const http_request&));
};

inline http_reply make_reply(uint16_t status_code, header_list headers = header_list(),
        std::string body = std::string()) {
    auto res = http_reply();
    res.connection_successful = true;
    res.status_code = status_code;
    res.headers = std::move(headers);
    res.body = std::move(body);
    return res;
}

inline http_reply make_connection_error(std::string error) {
    auto res = http_reply();
    res.connection_successful = false;
    res.error = std::move(error);
    return res;
}

struct recorded_request {
    std::string method;
    std::string url;
    header_list headers;
    std::string body;

    std::string header(const std::string& name) const {
        for (auto& pa : headers) {
            if (pa.first == name) return pa.second;
        }
        return std::string();
    }
};

/**
 * In-memory tus server that appends PATCH bodies at the declared offset,
 * can be scripted to fail requests
 */
class fake_tus_server : public transport {
public:
    std::string location = "https://x/session/42";
    uint64_t offset = 0;
    uint64_t upload_length = 0;
    std::string received;
    std::vector<recorded_request> requests;

    // number of upcoming PATCH requests to fail with a connection error
    int patch_failures = 0;
    // number of upcoming HEAD requests to fail with a connection error
    int probe_failures = 0;
    uint16_t creation_status = 201;
    std::string creation_body;
    // called after the request is recorded and before it is served
    std::function<void(const recorded_request&)> on_request;

    http_reply send(const http_request& req) override {
        auto rec = recorded_request();
        rec.method = req.method;
        rec.url = req.url;
        rec.headers = req.headers;
        if (req.body_length > 0) {
            rec.body = std::string(req.body, req.body_length);
        }
        requests.push_back(rec);
        if (on_request) {
            on_request(requests.back());
        }
        if ("POST" == req.method) {
            return create(rec);
        } else if ("HEAD" == req.method) {
            return head();
        } else if ("PATCH" == req.method) {
            return patch(rec);
        }
        return make_reply(405);
    }

    std::vector<recorded_request> by_method(const std::string& method) const {
        auto res = std::vector<recorded_request>();
        for (auto& rec : requests) {
            if (method == rec.method) res.push_back(rec);
        }
        return res;
    }

private:
    http_reply create(const recorded_request& rec) {
        if (201 != creation_status) {
            return make_reply(creation_status, header_list(), creation_body);
        }
        if (!protocol::parse_offset(rec.header(protocol::header_upload_length), upload_length)) {
            return make_reply(400);
        }
        auto headers = header_list();
        if (!location.empty()) {
            headers.emplace_back(protocol::header_location, location);
        }
        return make_reply(201, std::move(headers));
    }

    http_reply head() {
        if (probe_failures > 0) {
            probe_failures -= 1;
            return make_connection_error("Could not resolve host");
        }
        auto headers = header_list();
        headers.emplace_back(protocol::header_upload_offset, sl::support::to_string(offset));
        return make_reply(200, std::move(headers));
    }

    http_reply patch(const recorded_request& rec) {
        if (patch_failures > 0) {
            patch_failures -= 1;
            return make_connection_error("Connection reset by peer");
        }
        uint64_t declared = 0;
        if (!protocol::parse_offset(rec.header(protocol::header_upload_offset), declared) ||
                declared != offset) {
            return make_reply(409);
        }
        received += rec.body;
        offset += rec.body.length();
        auto headers = header_list();
        headers.emplace_back(protocol::header_upload_offset, sl::support::to_string(offset));
        return make_reply(204, std::move(headers));
    }
};

} // namespace
}

#endif /* TUSCLIENT_TEST_FAKE_TUS_SERVER_HPP */
