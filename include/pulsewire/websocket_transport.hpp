/**
 * @file websocket_transport.hpp
 * @brief libcurl WebSocket transport for PulseWire
 */

#ifndef PULSEWIRE_WEBSOCKET_TRANSPORT_HPP
#define PULSEWIRE_WEBSOCKET_TRANSPORT_HPP

#include "transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <spdlog/logger.h>

namespace pulsewire {

/**
 * Transport speaking JSON text frames over a WebSocket
 */
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(const std::string& url, const Headers& headers, Millis timeout) override;
    void send(const Envelope& envelope) override;
    void ping() override;
    void close() override;
    bool is_open() const override;

private:
    void send_frame(const std::string& payload, unsigned int flags);
    void read_loop();
    void handle_frame(const std::string& payload, int flags);
    void shutdown_handle();

    std::shared_ptr<spdlog::logger> logger_;
    void* curl_;
    void* header_list_;
    std::string url_;
    std::atomic<bool> open_;
    std::atomic<bool> closing_;
    std::thread reader_;
    mutable std::mutex io_mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_WEBSOCKET_TRANSPORT_HPP
