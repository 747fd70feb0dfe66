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

/* 
 * File:   upload_orchestrator.hpp
 * Author: alex
 */

#ifndef TUSCLIENT_UPLOAD_ORCHESTRATOR_HPP
#define TUSCLIENT_UPLOAD_ORCHESTRATOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "cancel_token.hpp"
#include "transport.hpp"
#include "upload_config.hpp"
#include "upload_outcome.hpp"

namespace tusclient {

enum class upload_state {
    idle, creating_session, transferring, succeeded, failed
};

/**
 * Drives a single upload: creates a session, then probes the server offset
 * and sends chunks until the whole buffer is accepted or retries are exhausted.
 * 
 * Exactly one of 'on_success' or 'on_error' is called once per 'upload' call,
 * 'on_progress' may be called before it any number of times.
 * Not thread-safe, the only member that may be used concurrently is
 * the cancel token passed to constructor.
 */
class upload_orchestrator {
public:
    // returns false if upload must be abandoned
    using backoff_waiter = std::function<bool(std::chrono::milliseconds)>;

private:
    transport& http;
    upload_options options;
    cancel_token& token;
    backoff_waiter waiter;

    upload_state state = upload_state::idle;
    transfer_cursor cursor;

public:
    /**
     * Constructor
     * 
     * @param http transport to perform requests with
     * @param options endpoint, chunk size and retry settings
     * @param token cancellation token checked before every request and during backoff
     * @param waiter backoff wait implementation, waits on the token if not specified
     */
    upload_orchestrator(transport& http, upload_options options, cancel_token& token,
            backoff_waiter waiter = backoff_waiter());

    upload_orchestrator(const upload_orchestrator&) = delete;

    upload_orchestrator& operator=(const upload_orchestrator&) = delete;

    upload_outcome upload(const char* data, uint64_t length, const std::string& filename,
            const upload_callbacks& callbacks);

    upload_state get_state() const {
        return state;
    }

    const transfer_cursor& get_cursor() const {
        return cursor;
    }

private:
    upload_outcome run(const char* data, uint64_t length, const std::string& filename,
            const upload_callbacks& callbacks);

    upload_outcome transfer(const upload_session& session, const char* data,
            const upload_callbacks& callbacks);

    bool backoff(std::chrono::milliseconds duration);

    void dispatch(const upload_outcome& outcome, const upload_callbacks& callbacks);
};

} // namespace

#endif /* TUSCLIENT_UPLOAD_ORCHESTRATOR_HPP */
