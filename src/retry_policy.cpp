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

#include "retry_policy.hpp"

#include "staticlib/support.hpp"

#include "wilton/support/exception.hpp"

namespace tusclient {

retry_policy::retry_policy(uint32_t max_retries, std::chrono::milliseconds step) :
max_retries(max_retries),
step(step) {
    if (0 == max_retries) throw wilton::support::exception(TRACEMSG(
            "Invalid 'maxRetries' specified: [0]"));
}

retry_decision retry_policy::on_failure(uint32_t retry_count) const {
    auto res = retry_decision();
    res.retry_count = retry_count + 1;
    if (res.retry_count >= max_retries) {
        res.exhausted = true;
    } else {
        res.backoff = step * static_cast<int64_t>(res.retry_count);
    }
    return res;
}

} // namespace
