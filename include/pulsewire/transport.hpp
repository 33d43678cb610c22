/**
 * @file transport.hpp
 * @brief Duplex message channel used by the connection manager
 */

#ifndef PULSEWIRE_TRANSPORT_HPP
#define PULSEWIRE_TRANSPORT_HPP

#include "types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace pulsewire {

using Headers = std::map<std::string, std::string>;

/**
 * Duplex channel to the remote service.
 *
 * open() and send() may block; everything else must return promptly.
 * Handlers may be invoked from any thread, including from inside send().
 */
class Transport {
public:
    using MessageHandler = std::function<void(const Envelope&)>;
    using CloseHandler = std::function<void(int code, const std::string& reason)>;
    using PongHandler = std::function<void()>;

    virtual ~Transport() = default;

    /**
     * Open the channel
     * @param url Endpoint URL
     * @param headers Extra request headers
     * @param timeout Upper bound for the handshake
     * @throws TimeoutError if the handshake does not finish in time
     * @throws ConnectionError on any other failure
     */
    virtual void open(const std::string& url, const Headers& headers, Millis timeout) = 0;

    /**
     * Send one envelope
     * @throws ConnectionError if the channel is closed or the write fails
     */
    virtual void send(const Envelope& envelope) = 0;

    /**
     * Send a liveness probe; the answer arrives through the pong handler
     */
    virtual void ping() = 0;

    /**
     * Close the channel. Does not invoke the close handler.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    void on_message(MessageHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        message_handler_ = std::move(handler);
    }

    void on_close(CloseHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        close_handler_ = std::move(handler);
    }

    void on_pong(PongHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        pong_handler_ = std::move(handler);
    }

protected:
    void emit_message(const Envelope& envelope) {
        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = message_handler_;
        }
        if (handler) handler(envelope);
    }

    void emit_close(int code, const std::string& reason) {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = close_handler_;
        }
        if (handler) handler(code, reason);
    }

    void emit_pong() {
        PongHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = pong_handler_;
        }
        if (handler) handler();
    }

private:
    MessageHandler message_handler_;
    CloseHandler close_handler_;
    PongHandler pong_handler_;
    std::mutex handlers_mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_TRANSPORT_HPP
