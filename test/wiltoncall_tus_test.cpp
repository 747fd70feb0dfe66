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

#include <string>

#include <gtest/gtest.h>

#include "staticlib/io.hpp"

#include "wilton/support/buffer.hpp"
#include "wilton/support/exception.hpp"

namespace tusclient {

// exported by the module library
wilton::support::buffer tus_upload_file(sl::io::span<const char> data);

namespace { // anonymous

void call(const std::string& json) {
    tus_upload_file(sl::io::span<const char>(json.data(), json.length()));
}

} // namespace

TEST(wiltoncall_tus_test, file_path_required) {
    EXPECT_THROW(call("{}"), wilton::support::exception);
    EXPECT_THROW(call("{\"fileName\": \"game.zip\"}"), wilton::support::exception);
}

TEST(wiltoncall_tus_test, unknown_field_rejected) {
    EXPECT_THROW(call("{\"filePath\": \"game.zip\", \"chunkSize\": 10}"), wilton::support::exception);
}

TEST(wiltoncall_tus_test, missing_file_rejected) {
    EXPECT_THROW(call("{\"filePath\": \"/nonexistent/dir/game.zip\"}"), std::exception);
}

} // namespace
