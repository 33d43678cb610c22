/**
 * @file websocket_transport.cpp
 * @brief libcurl WebSocket transport implementation for PulseWire
 */

#include "pulsewire/websocket_transport.hpp"
#include "pulsewire/errors.hpp"
#include <curl/curl.h>
#include <chrono>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
#define poll WSAPoll
#else
#include <poll.h>
#endif

namespace pulsewire {

static constexpr std::size_t RECV_CHUNK_SIZE = 64 * 1024;
static constexpr int POLL_INTERVAL_MS = 200;
static constexpr int CLOSE_NORMAL = 1000;
static constexpr int CLOSE_ABNORMAL = 1006;

static CURL* as_curl(void* handle) {
    return static_cast<CURL*>(handle);
}

static FailureKind failure_for_http_status(long status) {
    if (status == 401 || status == 403) return FailureKind::Auth;
    if (status == 429) return FailureKind::RateLimited;
    if (status >= 500) return FailureKind::Server;
    return FailureKind::Network;
}

static bool wait_socket(curl_socket_t fd, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    return poll(&pfd, 1, timeout_ms) > 0;
}

WebSocketTransport::WebSocketTransport(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)),
      curl_(nullptr),
      header_list_(nullptr),
      open_(false),
      closing_(false) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WebSocketTransport::~WebSocketTransport() {
    close();
    if (reader_.joinable()) {
        reader_.join();
    }
    shutdown_handle();
    curl_global_cleanup();
}

void WebSocketTransport::open(const std::string& url, const Headers& headers, Millis timeout) {
    if (open_) {
        throw ConnectionError("Transport is already open", FailureKind::Unknown, "ALREADY_OPEN", url);
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    shutdown_handle();
    closing_ = false;

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ConnectionError("Failed to initialize CURL", FailureKind::Unknown, "CURL_INIT", url);
    }

    struct curl_slist* list = nullptr;
    list = curl_slist_append(list, (std::string("User-Agent: ") + PULSEWIRE_USER_AGENT).c_str());
    for (const auto& [name, value] : headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        std::string message = curl_easy_strerror(res);
        curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutError("WebSocket handshake timed out: " + message, timeout);
        }
        FailureKind failure = http_code != 0 ? failure_for_http_status(http_code) : FailureKind::Network;
        throw ConnectionError("WebSocket connect failed: " + message, failure, "CONNECT_FAILED", url);
    }

    // Handshake finished but the timeout applied only to it
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 0L);

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        curl_ = curl;
        header_list_ = list;
        url_ = url;
        open_ = true;
    }

    if (logger_) {
        logger_->info("WebSocket open: {}", url);
    }

    reader_ = std::thread([this]() { read_loop(); });
}

void WebSocketTransport::send(const Envelope& envelope) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_ || !curl_) {
        throw ConnectionError("Transport is not open", FailureKind::Network, "NOT_OPEN", url_);
    }
    send_frame(envelope.to_json().dump(), CURLWS_TEXT);
}

void WebSocketTransport::ping() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_ || !curl_) {
        throw ConnectionError("Transport is not open", FailureKind::Network, "NOT_OPEN", url_);
    }
    send_frame("", CURLWS_PING);
}

void WebSocketTransport::close() {
    closing_ = true;

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (open_ && curl_) {
            std::string payload;
            payload.push_back(static_cast<char>((CLOSE_NORMAL >> 8) & 0xFF));
            payload.push_back(static_cast<char>(CLOSE_NORMAL & 0xFF));
            try {
                send_frame(payload, CURLWS_CLOSE);
            } catch (const ConnectionError& e) {
                if (logger_) {
                    logger_->debug("Close frame not delivered: {}", e.what());
                }
            }
        }
        open_ = false;
    }

    // The reader may be the caller when closing from a close handler
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
        shutdown_handle();
    }
}

bool WebSocketTransport::is_open() const {
    return open_;
}

void WebSocketTransport::send_frame(const std::string& payload, unsigned int flags) {
    CURL* curl = as_curl(curl_);
    std::size_t offset = 0;

    do {
        std::size_t sent = 0;
        CURLcode res = curl_ws_send(curl, payload.data() + offset, payload.size() - offset,
                                    &sent, 0, flags);
        if (res == CURLE_AGAIN) {
            curl_socket_t fd = CURL_SOCKET_BAD;
            curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &fd);
            if (fd == CURL_SOCKET_BAD) {
                throw ConnectionError("WebSocket socket lost", FailureKind::Network, "SEND_FAILED", url_);
            }
            wait_socket(fd, POLLOUT, POLL_INTERVAL_MS);
            continue;
        }
        if (res != CURLE_OK) {
            throw ConnectionError(std::string("WebSocket send failed: ") + curl_easy_strerror(res),
                                  FailureKind::Network, "SEND_FAILED", url_);
        }
        offset += sent;
    } while (offset < payload.size());
}

void WebSocketTransport::read_loop() {
    std::string message;
    std::string buffer(RECV_CHUNK_SIZE, '\0');

    while (!closing_) {
        curl_socket_t fd = CURL_SOCKET_BAD;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!curl_) break;
            curl_easy_getinfo(as_curl(curl_), CURLINFO_ACTIVESOCKET, &fd);
        }
        if (fd == CURL_SOCKET_BAD) {
            break;
        }
        if (!wait_socket(fd, POLLIN, POLL_INTERVAL_MS)) {
            continue;
        }

        while (!closing_) {
            std::size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode res;
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                const struct curl_ws_frame* frame = nullptr;
                res = curl_ws_recv(as_curl(curl_), &buffer[0], buffer.size(), &received, &frame);
                meta = frame;
            }

            if (res == CURLE_AGAIN) {
                break;
            }
            if (res != CURLE_OK) {
                std::string reason = curl_easy_strerror(res);
                open_ = false;
                if (!closing_) {
                    if (logger_) {
                        logger_->warn("WebSocket read failed: {}", reason);
                    }
                    emit_close(CLOSE_ABNORMAL, reason);
                }
                return;
            }
            if (!meta) {
                continue;
            }

            message.append(buffer.data(), received);
            if (meta->bytesleft > 0) {
                continue;
            }

            if (meta->flags & CURLWS_CLOSE) {
                int code = CLOSE_NORMAL;
                std::string reason;
                if (message.size() >= 2) {
                    code = (static_cast<unsigned char>(message[0]) << 8) |
                           static_cast<unsigned char>(message[1]);
                    reason = message.substr(2);
                }
                open_ = false;
                if (!closing_) {
                    if (logger_) {
                        logger_->info("WebSocket closed by peer: {} {}", code, reason);
                    }
                    emit_close(code, reason);
                }
                return;
            }

            if (meta->flags & CURLWS_CONT) {
                continue;
            }

            handle_frame(message, meta->flags);
            message.clear();
        }
    }
}

void WebSocketTransport::handle_frame(const std::string& payload, int flags) {
    if (flags & CURLWS_PONG) {
        emit_pong();
        return;
    }
    if (flags & CURLWS_PING) {
        // libcurl answers pings itself outside raw mode
        return;
    }
    if (!(flags & CURLWS_TEXT)) {
        if (logger_) {
            logger_->debug("Ignoring binary frame of {} bytes", payload.size());
        }
        return;
    }

    try {
        emit_message(Envelope::from_json(json::parse(payload)));
    } catch (const json::exception& e) {
        if (logger_) {
            logger_->warn("Dropping malformed frame: {}", e.what());
        }
    } catch (const ValidationError& e) {
        if (logger_) {
            logger_->warn("Dropping invalid envelope: {}", e.what());
        }
    }
}

void WebSocketTransport::shutdown_handle() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (curl_) {
        curl_easy_cleanup(as_curl(curl_));
        curl_ = nullptr;
    }
    if (header_list_) {
        curl_slist_free_all(static_cast<struct curl_slist*>(header_list_));
        header_list_ = nullptr;
    }
    open_ = false;
}

} // namespace pulsewire
