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

#ifndef TUSCLIENT_TEST_LOOPBACK_HTTP_SERVER_HPP
#define TUSCLIENT_TEST_LOOPBACK_HTTP_SERVER_HPP

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace tusclient {
namespace testing {

/**
 * Accepts a single connection on 127.0.0.1, records the raw request
 * and answers it with a canned response.
 */
class loopback_http_server {
    int listen_fd = -1;
    uint16_t port = 0;
    std::string response;
    std::string request;
    std::thread worker;

public:
    explicit loopback_http_server(std::string response) :
    response(std::move(response)) {
        listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0) throw std::runtime_error("socket failed");
        // accept gives up if no client comes
        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        ::setsockopt(listen_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        struct sockaddr_in addr;
        std::fill_n(reinterpret_cast<char*>(&addr), sizeof(addr), '\0');
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (0 != ::bind(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) ||
                0 != ::listen(listen_fd, 1)) {
            ::close(listen_fd);
            throw std::runtime_error("bind failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
        worker = std::thread([this] {
            serve_one();
        });
    }

    loopback_http_server(const loopback_http_server&) = delete;

    loopback_http_server& operator=(const loopback_http_server&) = delete;

    ~loopback_http_server() {
        finish();
        ::close(listen_fd);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    // waits for the exchange to complete
    const std::string& received() {
        finish();
        return request;
    }

private:
    void finish() {
        if (worker.joinable()) {
            worker.join();
        }
    }

    void serve_one() {
        int fd = ::accept(listen_fd, nullptr, nullptr);
        if (fd < 0) return;
        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        char buf[4096];
        size_t expected = std::string::npos;
        while (std::string::npos == expected || request.length() < expected) {
            ssize_t read = ::recv(fd, buf, sizeof(buf), 0);
            if (read <= 0) break;
            request.append(buf, static_cast<size_t>(read));
            auto head_end = request.find("\r\n\r\n");
            if (std::string::npos != head_end && std::string::npos == expected) {
                expected = head_end + 4 + content_length(request.substr(0, head_end));
            }
        }
        size_t sent = 0;
        while (sent < response.length()) {
            ssize_t written = ::send(fd, response.data() + sent, response.length() - sent, MSG_NOSIGNAL);
            if (written <= 0) break;
            sent += static_cast<size_t>(written);
        }
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }

    static size_t content_length(std::string head) {
        std::transform(head.begin(), head.end(), head.begin(), [](char ch) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        });
        auto pos = head.find("\r\ncontent-length:");
        if (std::string::npos == pos) return 0;
        return static_cast<size_t>(std::strtoul(head.c_str() + pos + 17, nullptr, 10));
    }
};

} // namespace
}

#endif /* TUSCLIENT_TEST_LOOPBACK_HTTP_SERVER_HPP */
