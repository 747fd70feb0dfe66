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

#ifndef TUSCLIENT_TUS_PROTOCOL_HPP
#define TUSCLIENT_TUS_PROTOCOL_HPP

#include <cstdint>
#include <string>

namespace tusclient {
namespace protocol {

const std::string version = "1.0.0";

const std::string header_tus_resumable = "Tus-Resumable";
const std::string header_upload_length = "Upload-Length";
const std::string header_upload_metadata = "Upload-Metadata";
const std::string header_upload_offset = "Upload-Offset";
const std::string header_location = "Location";
const std::string header_content_type = "Content-Type";

const std::string offset_content_type = "application/offset+octet-stream";

const std::string default_endpoint = "https://jamuploads.vrg.party/files";

const uint64_t default_chunk_size = 1024 * 1024;
const uint32_t default_max_retries = 3;
const uint32_t default_backoff_step_millis = 1000;

/**
 * Parses a decimal offset header value, digits only, must fit into 64 bits
 * 
 * @param str header value
 * @param out parsed value
 * @return false if the value is empty, contains non-digits or overflows
 */
bool parse_offset(const std::string& str, uint64_t& out);

/**
 * Checks that a buffer length can be passed as an 'int' length
 * parameter of the C API
 */
bool is_int_length(uint64_t length);

} // namespace
}

#endif /* TUSCLIENT_TUS_PROTOCOL_HPP */
