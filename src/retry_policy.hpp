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

#ifndef TUSCLIENT_RETRY_POLICY_HPP
#define TUSCLIENT_RETRY_POLICY_HPP

#include <chrono>
#include <cstdint>

namespace tusclient {

struct retry_decision {
    bool exhausted = false;
    uint32_t retry_count = 0;
    std::chrono::milliseconds backoff{0};
};

/**
 * Linear backoff: wait 'retry_count * step' before the next attempt,
 * give up once 'retry_count' reaches 'max_retries'
 */
class retry_policy {
    uint32_t max_retries;
    std::chrono::milliseconds step;

public:
    retry_policy(uint32_t max_retries, std::chrono::milliseconds step);

    retry_decision on_failure(uint32_t retry_count) const;

    uint32_t on_success() const {
        return 0;
    }

    uint32_t get_max_retries() const {
        return max_retries;
    }
};

} // namespace

#endif /* TUSCLIENT_RETRY_POLICY_HPP */
