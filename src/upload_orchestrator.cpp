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
 * File:   upload_orchestrator.cpp
 * Author: alex
 */

#include "upload_orchestrator.hpp"

#include <algorithm>

#include "staticlib/support.hpp"

#include "wilton/support/exception.hpp"
#include "wilton/support/logging.hpp"

#include "chunk_transmitter.hpp"
#include "offset_prober.hpp"
#include "retry_policy.hpp"
#include "session_creator.hpp"

namespace tusclient {

namespace { // anonymous

const std::string logger = std::string("tusclient.upload");

const std::string cancelled_msg = "Upload cancelled";

void report_progress(const upload_callbacks& callbacks, uint64_t uploaded, uint64_t total) {
    if (!callbacks.on_progress) return;
    float progress = total > 0 ?
            static_cast<float>(static_cast<double>(uploaded) / static_cast<double>(total)) : 0.0f;
    callbacks.on_progress(progress);
}

} // namespace

upload_orchestrator::upload_orchestrator(transport& http, upload_options options, cancel_token& token,
        backoff_waiter waiter) :
http(http),
options(std::move(options)),
token(token),
waiter(std::move(waiter)) {
    if (0 == this->options.chunk_size) throw wilton::support::exception(TRACEMSG(
            "Invalid 'chunkSizeBytes' specified: [0]"));
    if (!this->waiter) {
        this->waiter = [this](std::chrono::milliseconds duration) {
            return this->token.wait_for(duration);
        };
    }
}

upload_outcome upload_orchestrator::upload(const char* data, uint64_t length, const std::string& filename,
        const upload_callbacks& callbacks) {
    state = upload_state::idle;
    cursor = transfer_cursor();
    wilton::support::log_debug(logger, "Starting upload, file: [" + filename + "]," +
            " size: [" + sl::support::to_string(length) + "] bytes");
    auto outcome = [&] {
        try {
            return run(data, length, filename, callbacks);
        } catch (const std::exception& e) {
            return upload_outcome::failure(e.what());
        } catch (...) {
            return upload_outcome::failure("Unknown exception raised");
        }
    }();
    state = outcome.is_success() ? upload_state::succeeded : upload_state::failed;
    dispatch(outcome, callbacks);
    return outcome;
}

upload_outcome upload_orchestrator::run(const char* data, uint64_t length, const std::string& filename,
        const upload_callbacks& callbacks) {
    if (nullptr == data && length > 0) throw wilton::support::exception(TRACEMSG(
            "Null file data specified, length: [" + sl::support::to_string(length) + "]"));
    report_progress(callbacks, 0, length);
    if (token.is_cancelled()) {
        return upload_outcome::failure(cancelled_msg);
    }

    state = upload_state::creating_session;
    auto creator = session_creator(http, options.url, options.metadata);
    auto created = creator.create(length, filename);
    if (!created.success) {
        return upload_outcome::failure(created.error);
    }
    wilton::support::log_info(logger, "Upload session created: [" + created.value + "]");

    auto session = upload_session();
    session.session_url = std::move(created.value);
    session.total_size = length;
    session.filename = filename;
    state = upload_state::transferring;
    return transfer(session, data, callbacks);
}

upload_outcome upload_orchestrator::transfer(const upload_session& session, const char* data,
        const upload_callbacks& callbacks) {
    auto prober = offset_prober(http);
    auto transmitter = chunk_transmitter(http);
    auto policy = retry_policy(options.max_retries, std::chrono::milliseconds(options.backoff_step_millis));

    for (;;) {
        if (token.is_cancelled()) {
            return upload_outcome::failure(cancelled_msg);
        }

        // probe failures are tolerated, previous cursor is kept
        auto probed = prober.probe(session.session_url);
        if (!probed.success) {
            wilton::support::log_warn(logger, probed.error + ", continuing from offset: [" +
                    sl::support::to_string(cursor.uploaded_bytes) + "]");
        } else if (probed.value < cursor.uploaded_bytes || probed.value > session.total_size) {
            wilton::support::log_warn(logger, "Ignoring inconsistent server offset: [" +
                    sl::support::to_string(probed.value) + "], current offset: [" +
                    sl::support::to_string(cursor.uploaded_bytes) + "], total size: [" +
                    sl::support::to_string(session.total_size) + "]");
        } else {
            cursor.uploaded_bytes = probed.value;
        }

        if (cursor.uploaded_bytes >= session.total_size) {
            wilton::support::log_info(logger, "Upload complete, URL: [" + session.session_url + "]");
            return upload_outcome::success(session.session_url);
        }

        if (token.is_cancelled()) {
            return upload_outcome::failure(cancelled_msg);
        }

        auto chunk = chunk_request();
        chunk.offset = cursor.uploaded_bytes;
        chunk.length = std::min(options.chunk_size, session.total_size - cursor.uploaded_bytes);
        chunk.data = data + chunk.offset;

        auto sent = transmitter.transmit(session.session_url, chunk);
        if (sent.success) {
            cursor.uploaded_bytes = sent.value;
            cursor.retry_count = policy.on_success();
            report_progress(callbacks, cursor.uploaded_bytes, session.total_size);
            continue;
        }

        auto decision = policy.on_failure(cursor.retry_count);
        cursor.retry_count = decision.retry_count;
        wilton::support::log_warn(logger, sent.error + ", attempt: [" +
                sl::support::to_string(decision.retry_count) + "] of [" +
                sl::support::to_string(policy.get_max_retries()) + "]");
        if (decision.exhausted) {
            return upload_outcome::failure("Upload failed after " +
                    sl::support::to_string(policy.get_max_retries()) + " retries");
        }
        if (!backoff(decision.backoff)) {
            return upload_outcome::failure(cancelled_msg);
        }
    }
}

bool upload_orchestrator::backoff(std::chrono::milliseconds duration) {
    wilton::support::log_debug(logger, "Waiting before retry, millis: [" +
            sl::support::to_string(duration.count()) + "]");
    bool proceed = waiter(duration);
    return proceed && !token.is_cancelled();
}

void upload_orchestrator::dispatch(const upload_outcome& outcome, const upload_callbacks& callbacks) {
    try {
        if (outcome.is_success()) {
            if (callbacks.on_success) {
                callbacks.on_success(outcome.session_url());
            }
        } else {
            wilton::support::log_error(logger, "Upload failed: " + outcome.message());
            if (callbacks.on_error) {
                callbacks.on_error(outcome.message());
            }
        }
    } catch (const std::exception& e) {
        wilton::support::log_error(logger, TRACEMSG(e.what() + "\nException raised by upload callback"));
    } catch (...) {
        wilton::support::log_error(logger, TRACEMSG("Unknown exception raised by upload callback"));
    }
}

} // namespace
