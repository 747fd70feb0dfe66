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

#ifndef TUSCLIENT_CANCEL_TOKEN_HPP
#define TUSCLIENT_CANCEL_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tusclient {

/**
 * Shared between the uploading thread and the thread that
 * may abandon the upload, all methods are thread-safe
 */
class cancel_token {
    std::mutex mtx;
    std::condition_variable cond;
    std::atomic_bool cancelled;

public:
    cancel_token();

    cancel_token(const cancel_token&) = delete;

    cancel_token& operator=(const cancel_token&) = delete;

    void cancel();

    bool is_cancelled() const;

    /**
     * Blocks for the specified time or until cancelled
     * 
     * @param timeout time to wait
     * @return false if token was cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds timeout);
};

} // namespace

#endif /* TUSCLIENT_CANCEL_TOKEN_HPP */
