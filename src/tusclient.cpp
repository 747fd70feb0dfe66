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
 * File:   tusclient.cpp
 * Author: alex
 */

#include "tusclient/tusclient.h"

#include <memory>
#include <string>

#include "staticlib/config.hpp"
#include "staticlib/http.hpp"
#include "staticlib/json.hpp"
#include "staticlib/support.hpp"

#include "wilton/support/alloc.hpp"
#include "wilton/support/logging.hpp"

#include "cancel_token.hpp"
#include "session_transport.hpp"
#include "upload_config.hpp"
#include "upload_orchestrator.hpp"

namespace { // anonymous

const std::string logger = std::string("tusclient.upload");

std::unique_ptr<sl::http::session> create_session(bool multi_threaded) {
    if (multi_threaded) {
        return std::unique_ptr<sl::http::session>(new sl::http::multi_threaded_session(
                sl::http::session_options()));
    }
    return std::unique_ptr<sl::http::session>(new sl::http::single_threaded_session(
            sl::http::session_options()));
}

} // namespace

struct tusclient_Uploader {
private:
    std::unique_ptr<sl::http::session> http;
    tusclient::session_transport delegate;
    tusclient::upload_options options;
    tusclient::cancel_token token;

public:
    tusclient_Uploader(tusclient::upload_config&& conf) :
    http(create_session(conf.use_multi_threaded_session)),
    delegate(*http, std::move(conf.request_options)),
    options(std::move(conf.options)) { }

    tusclient::transport& impl() {
        return delegate;
    }

    const tusclient::upload_options& get_options() const {
        return options;
    }

    tusclient::cancel_token& get_token() {
        return token;
    }
};

char* tusclient_Uploader_create(tusclient_Uploader** uploader_out,
        const char* conf_json, int conf_json_len) /* noexcept */ {
    if (nullptr == uploader_out) return wilton::support::alloc_copy(TRACEMSG("Null 'uploader_out' parameter specified"));
    if (nullptr == conf_json) return wilton::support::alloc_copy(TRACEMSG("Null 'conf_json' parameter specified"));
    if (!sl::support::is_uint32_positive(conf_json_len)) return wilton::support::alloc_copy(TRACEMSG(
            "Invalid 'conf_json_len' parameter specified: [" + sl::support::to_string(conf_json_len) + "]"));
    try {
        uint32_t conf_json_len_u32 = static_cast<uint32_t> (conf_json_len);
        std::string json_str{conf_json, conf_json_len_u32};
        sl::json::value json = sl::json::loads(json_str);
        wilton::support::log_debug(logger, "Creating uploader, options: [" + json.dumps() + "] ...");
        tusclient::upload_config conf{std::move(json)};
        tusclient_Uploader* uploader_ptr = new tusclient_Uploader(std::move(conf));
        *uploader_out = uploader_ptr;
        return nullptr;
    } catch (const std::exception& e) {
        return wilton::support::alloc_copy(TRACEMSG(e.what() + "\nException raised"));
    }
}

char* tusclient_Uploader_close(tusclient_Uploader* uploader) /* noexcept */ {
    if (nullptr == uploader) return wilton::support::alloc_copy(TRACEMSG("Null 'uploader' parameter specified"));
    try {
        delete uploader;
        return nullptr;
    } catch (const std::exception& e) {
        return wilton::support::alloc_copy(TRACEMSG(e.what() + "\nException raised"));
    }
}

char* tusclient_Uploader_upload(tusclient_Uploader* uploader,
        const char* file_data, int file_data_len,
        const char* filename, int filename_len,
        void* cb_ctx,
        void (*progress_cb)(
                void* cb_ctx,
                float progress),
        void (*success_cb)(
                void* cb_ctx,
                const char* session_url,
                int session_url_len),
        void (*error_cb)(
                void* cb_ctx,
                const char* message,
                int message_len)) /* noexcept */ {
    if (nullptr == uploader) return wilton::support::alloc_copy(TRACEMSG("Null 'uploader' parameter specified"));
    if (!sl::support::is_uint32(file_data_len)) return wilton::support::alloc_copy(TRACEMSG(
            "Invalid 'file_data_len' parameter specified: [" + sl::support::to_string(file_data_len) + "]"));
    if (nullptr == file_data && file_data_len > 0) return wilton::support::alloc_copy(TRACEMSG(
            "Null 'file_data' parameter specified"));
    if (nullptr == filename) return wilton::support::alloc_copy(TRACEMSG("Null 'filename' parameter specified"));
    if (!sl::support::is_uint16_positive(filename_len)) return wilton::support::alloc_copy(TRACEMSG(
            "Invalid 'filename_len' parameter specified: [" + sl::support::to_string(filename_len) + "]"));
    try {
        auto filename_str = std::string(filename, static_cast<uint16_t> (filename_len));
        auto callbacks = tusclient::upload_callbacks();
        if (nullptr != progress_cb) {
            callbacks.on_progress = [cb_ctx, progress_cb](float progress) {
                progress_cb(cb_ctx, progress);
            };
        }
        if (nullptr != success_cb) {
            callbacks.on_success = [cb_ctx, success_cb](const std::string& url) {
                success_cb(cb_ctx, url.c_str(), static_cast<int>(url.length()));
            };
        }
        if (nullptr != error_cb) {
            callbacks.on_error = [cb_ctx, error_cb](const std::string& msg) {
                error_cb(cb_ctx, msg.c_str(), static_cast<int>(msg.length()));
            };
        }
        tusclient::upload_orchestrator orchestrator{uploader->impl(),
                uploader->get_options(), uploader->get_token()};
        auto outcome = orchestrator.upload(file_data, static_cast<uint32_t>(file_data_len),
                filename_str, callbacks);
        (void) outcome;
        return nullptr;
    } catch (const std::exception& e) {
        return wilton::support::alloc_copy(TRACEMSG(e.what() + "\nException raised"));
    }
}

char* tusclient_Uploader_cancel(tusclient_Uploader* uploader) /* noexcept */ {
    if (nullptr == uploader) return wilton::support::alloc_copy(TRACEMSG("Null 'uploader' parameter specified"));
    try {
        uploader->get_token().cancel();
        wilton::support::log_debug(logger, "Upload cancellation requested");
        return nullptr;
    } catch (const std::exception& e) {
        return wilton::support::alloc_copy(TRACEMSG(e.what() + "\nException raised"));
    }
}
