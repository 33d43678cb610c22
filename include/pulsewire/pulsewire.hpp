/**
 * @file pulsewire.hpp
 * @brief Main header for PulseWire
 *
 * Persistent messaging client runtime: connection lifecycle with
 * reconnect, QR and pairing-code authentication, and a rate-limited
 * priority queue for outbound operations.
 */

#ifndef PULSEWIRE_HPP
#define PULSEWIRE_HPP

#include "pulsewire/types.hpp"
#include "pulsewire/errors.hpp"
#include "pulsewire/config.hpp"
#include "pulsewire/logging.hpp"
#include "pulsewire/scheduler.hpp"
#include "pulsewire/context.hpp"
#include "pulsewire/events.hpp"
#include "pulsewire/transport.hpp"
#include "pulsewire/websocket_transport.hpp"
#include "pulsewire/session_store.hpp"
#include "pulsewire/rate_limiter.hpp"
#include "pulsewire/retry_queue.hpp"
#include "pulsewire/auth_flow.hpp"
#include "pulsewire/connection_manager.hpp"
#include "pulsewire/client.hpp"

namespace pulsewire {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace pulsewire

#endif // PULSEWIRE_HPP
