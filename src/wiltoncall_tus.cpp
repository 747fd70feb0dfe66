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
 * File:   wiltoncall_tus.cpp
 * Author: alex
 */

#include <functional>
#include <memory>
#include <string>

#include "staticlib/io.hpp"
#include "staticlib/json.hpp"
#include "staticlib/support.hpp"
#include "staticlib/tinydir.hpp"
#include "staticlib/utils.hpp"

#include "tusclient/tusclient.h"

#include "tus_protocol.hpp"

#include "wilton/support/alloc.hpp"
#include "wilton/support/buffer.hpp"
#include "wilton/support/exception.hpp"
#include "wilton/support/logging.hpp"
#include "wilton/support/registrar.hpp"

namespace tusclient {

namespace { // anonymous

const std::string logger = std::string("tusclient.module");

struct upload_result {
    bool complete = false;
    bool success = false;
    std::string text;
};

std::unique_ptr<tusclient_Uploader, std::function<void(tusclient_Uploader*)>> create_uploader(
        const std::string& options) {
    tusclient_Uploader* uploader = nullptr;
    char* err = tusclient_Uploader_create(std::addressof(uploader),
            options.c_str(), static_cast<int>(options.length()));
    if (nullptr != err) wilton::support::throw_wilton_error(err, TRACEMSG(err));
    return std::unique_ptr<tusclient_Uploader, std::function<void(tusclient_Uploader*)>>(uploader,
            [](tusclient_Uploader* ptr) {
                char* err_close = tusclient_Uploader_close(ptr);
                if (nullptr != err_close) {
                    wilton::support::log_error(logger, TRACEMSG(err_close));
                    wilton_free(err_close);
                }
            });
}

} // namespace

wilton::support::buffer tus_upload_file(sl::io::span<const char> data) {
    // json parse
    auto json = sl::json::load(data);
    auto rfile = std::ref(sl::utils::empty_string());
    auto rname = std::ref(sl::utils::empty_string());
    auto options = std::string("{}");
    for (const sl::json::field& fi : json.as_object()) {
        auto& name = fi.name();
        if ("filePath" == name) {
            rfile = fi.as_string_nonempty_or_throw(name);
        } else if ("fileName" == name) {
            rname = fi.as_string_nonempty_or_throw(name);
        } else if ("options" == name) {
            options = fi.val().dumps();
        } else {
            throw wilton::support::exception(TRACEMSG("Unknown data field: [" + name + "]"));
        }
    }
    if (rfile.get().empty()) throw wilton::support::exception(TRACEMSG(
            "Required parameter 'filePath' not specified"));
    const std::string& file_path = rfile.get();
    const std::string file_name = !rname.get().empty() ? rname.get() : sl::utils::strip_parent_dir(file_path);

    // read whole file, tus upload works on a contiguous buffer
    auto src = sl::tinydir::file_source(file_path);
    auto sink = sl::io::string_sink();
    sl::io::copy_all(src, sink);
    const std::string& contents = sink.get_string();
    if (!protocol::is_int_length(contents.length())) throw wilton::support::exception(TRACEMSG(
            "File is too large, path: [" + file_path + "], size: [" + sl::support::to_string(contents.length()) + "]"));

    // call tusclient
    auto uploader = create_uploader(options);
    auto res = upload_result();
    char* err = tusclient_Uploader_upload(uploader.get(),
            contents.data(), static_cast<int>(contents.length()),
            file_name.c_str(), static_cast<int>(file_name.length()),
            std::addressof(res),
            [](void*, float progress) {
                wilton::support::log_debug(logger, "Upload progress: [" +
                        sl::support::to_string(static_cast<int>(progress * 100)) + "%]");
            },
            [](void* ctx, const char* url, int url_len) {
                upload_result* passed = static_cast<upload_result*> (ctx);
                passed->complete = true;
                passed->success = true;
                passed->text = std::string(url, static_cast<uint32_t>(url_len));
            },
            [](void* ctx, const char* msg, int msg_len) {
                upload_result* passed = static_cast<upload_result*> (ctx);
                passed->complete = true;
                passed->text = std::string(msg, static_cast<uint32_t>(msg_len));
            });
    if (nullptr != err) wilton::support::throw_wilton_error(err, TRACEMSG(err));
    if (!res.complete) throw wilton::support::exception(TRACEMSG(
            "Upload finished without outcome, file: [" + file_path + "]"));

    auto result = res.success ? sl::json::dumps({
        {"success", true},
        {"url", res.text}
    }) : sl::json::dumps({
        {"success", false},
        {"error", res.text}
    });
    return wilton::support::wrap_wilton_buffer(wilton::support::alloc_copy(result),
            static_cast<int>(result.length()));
}

} // namespace

extern "C" char* wilton_module_init() {
    try {
        wilton::support::register_wiltoncall("tus_upload_file", tusclient::tus_upload_file);
        return nullptr;
    } catch (const std::exception& e) {
        return wilton::support::alloc_copy(TRACEMSG(e.what() + "\nException raised"));
    }
}
