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

#ifndef TUSCLIENT_OFFSET_PROBER_HPP
#define TUSCLIENT_OFFSET_PROBER_HPP

#include <cstdint>
#include <string>

#include "step_result.hpp"
#include "transport.hpp"

namespace tusclient {

class offset_prober {
    transport& http;

public:
    explicit offset_prober(transport& http);

    step_result<uint64_t> probe(const std::string& session_url);
};

} // namespace

#endif /* TUSCLIENT_OFFSET_PROBER_HPP */
