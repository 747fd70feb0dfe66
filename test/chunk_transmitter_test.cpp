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

#include "chunk_transmitter.hpp"

#include <gmock/gmock.h>

#include "fake_tus_server.hpp"

namespace tusclient {

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::tusclient::testing::make_connection_error;
using ::tusclient::testing::make_reply;
using ::tusclient::testing::mock_transport;
using ::tusclient::testing::recorded_request;

namespace { // anonymous

header_list offset_header(const std::string& value) {
    auto res = header_list();
    res.emplace_back("Upload-Offset", value);
    return res;
}

chunk_request make_chunk(const std::string& data, uint64_t offset) {
    auto res = chunk_request();
    res.offset = offset;
    res.data = data.data();
    res.length = data.length();
    return res;
}

} // namespace

TEST(chunk_transmitter_test, sends_patch_at_offset) {
    mock_transport http;
    auto rec = recorded_request();
    EXPECT_CALL(http, send(_)).WillOnce(Invoke([&rec](const http_request& req) {
        rec.method = req.method;
        rec.url = req.url;
        rec.headers = req.headers;
        rec.body = std::string(req.body, req.body_length);
        return make_reply(204, offset_header("1048586"));
    }));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto res = transmitter.transmit("https://x/session/42", make_chunk(data, 1048576));

    ASSERT_TRUE(res.success);
    EXPECT_EQ(1048586u, res.value);
    EXPECT_EQ("PATCH", rec.method);
    EXPECT_EQ("https://x/session/42", rec.url);
    EXPECT_EQ("1.0.0", rec.header("Tus-Resumable"));
    EXPECT_EQ("application/offset+octet-stream", rec.header("Content-Type"));
    EXPECT_EQ("1048576", rec.header("Upload-Offset"));
    EXPECT_EQ(data, rec.body);
}

TEST(chunk_transmitter_test, server_offset_is_authoritative) {
    mock_transport http;
    EXPECT_CALL(http, send(_)).WillOnce(Return(make_reply(204, offset_header("4"))));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto res = transmitter.transmit("https://x/session/42", make_chunk(data, 0));
    ASSERT_TRUE(res.success);
    EXPECT_EQ(4u, res.value);
}

TEST(chunk_transmitter_test, inconsistent_offset) {
    mock_transport http;
    EXPECT_CALL(http, send(_))
            .WillOnce(Return(make_reply(204, offset_header("21"))))
            .WillOnce(Return(make_reply(204, offset_header("10"))));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    // more than was sent
    EXPECT_FALSE(transmitter.transmit("https://x/session/42", make_chunk(data, 10)).success);
    // nothing accepted
    EXPECT_FALSE(transmitter.transmit("https://x/session/42", make_chunk(data, 10)).success);
}

TEST(chunk_transmitter_test, accepted_offset_range_is_half_open) {
    mock_transport http;
    EXPECT_CALL(http, send(_))
            .WillOnce(Return(make_reply(204, offset_header("11"))))
            .WillOnce(Return(make_reply(204, offset_header("20"))));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto partial = transmitter.transmit("https://x/session/42", make_chunk(data, 10));
    ASSERT_TRUE(partial.success);
    EXPECT_EQ(11u, partial.value);
    auto whole = transmitter.transmit("https://x/session/42", make_chunk(data, 10));
    ASSERT_TRUE(whole.success);
    EXPECT_EQ(20u, whole.value);
}

TEST(chunk_transmitter_test, wrong_status) {
    mock_transport http;
    EXPECT_CALL(http, send(_)).WillOnce(Return(make_reply(409, offset_header("0"))));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto res = transmitter.transmit("https://x/session/42", make_chunk(data, 0));
    ASSERT_FALSE(res.success);
    EXPECT_EQ("Chunk upload failed (HTTP 409)", res.error);
}

TEST(chunk_transmitter_test, transport_error) {
    mock_transport http;
    EXPECT_CALL(http, send(_)).WillOnce(Return(make_connection_error("Operation timed out")));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto res = transmitter.transmit("https://x/session/42", make_chunk(data, 0));
    ASSERT_FALSE(res.success);
    EXPECT_EQ("Chunk upload failed: Operation timed out (HTTP 0)", res.error);
}

TEST(chunk_transmitter_test, missing_offset_header) {
    mock_transport http;
    EXPECT_CALL(http, send(_)).WillOnce(Return(make_reply(204)));

    auto data = std::string("0123456789");
    auto transmitter = chunk_transmitter(http);
    auto res = transmitter.transmit("https://x/session/42", make_chunk(data, 0));
    ASSERT_FALSE(res.success);
    EXPECT_EQ("Server did not return valid upload offset", res.error);
}

} // namespace
