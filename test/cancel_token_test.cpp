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

#include "cancel_token.hpp"

#include <thread>

#include <gtest/gtest.h>

namespace tusclient {

TEST(cancel_token_test, waits_full_timeout) {
    cancel_token token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(10)));
}

TEST(cancel_token_test, cancelled_before_wait) {
    cancel_token token;
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(60000)));
}

TEST(cancel_token_test, cancel_interrupts_wait) {
    cancel_token token;
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });
    bool completed = token.wait_for(std::chrono::milliseconds(60000));
    canceller.join();
    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(30));
}

} // namespace
