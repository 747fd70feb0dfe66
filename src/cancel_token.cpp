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

namespace tusclient {

cancel_token::cancel_token() {
    this->cancelled.exchange(false, std::memory_order_acq_rel);
}

void cancel_token::cancel() {
    {
        std::lock_guard<std::mutex> guard{mtx};
        cancelled.exchange(true, std::memory_order_acq_rel);
    }
    cond.notify_all();
}

bool cancel_token::is_cancelled() const {
    return cancelled.load(std::memory_order_acquire);
}

bool cancel_token::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lck(mtx);
    cond.wait_for(lck, timeout, [this] {
        return this->cancelled.load(std::memory_order_acquire);
    });
    return !cancelled.load(std::memory_order_acquire);
}

} // namespace
