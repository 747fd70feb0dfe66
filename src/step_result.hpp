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

#ifndef TUSCLIENT_STEP_RESULT_HPP
#define TUSCLIENT_STEP_RESULT_HPP

#include <string>
#include <utility>

namespace tusclient {

/**
 * Result of a single protocol step, expected failures
 * are reported as values, not as exceptions
 */
template<typename T>
struct step_result {
    bool success = false;
    T value = T();
    std::string error;

    static step_result ok(T value) {
        auto res = step_result();
        res.success = true;
        res.value = std::move(value);
        return res;
    }

    static step_result fail(std::string error) {
        auto res = step_result();
        res.error = std::move(error);
        return res;
    }
};

} // namespace

#endif /* TUSCLIENT_STEP_RESULT_HPP */
