/**
 * @file pairing.cpp
 * @brief Pairing-code authentication example for PulseWire
 */

#include <pulsewire/pulsewire.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using namespace pulsewire;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <phone-number>\n";
        return 1;
    }

    std::cout << "PulseWire - Pairing Example\n\n";

    try {
        ClientOptions options;
        options.auth_strategy = AuthStrategy::Pairing;
        options.pairing_number = argv[1];
        options.session_name = "pairing-example";
        apply_environment_overrides(options);

        ThreadScheduler scheduler;
        RuntimeContext context(scheduler, make_logger("pulsewire", options.log_level));

        ClientRuntime client(
            options,
            std::make_shared<WebSocketTransport>(context.logger("ws")),
            std::make_shared<FileSessionStore>(options.session_dir),
            context
        );

        client.on(EventType::PairingCode, [](const ClientEvent& event) {
            std::cout << "Enter this code on your phone: "
                      << event.data["code"].get<std::string>() << "\n";
        });

        client.on(EventType::Authenticated, [](const ClientEvent& event) {
            std::cout << "Authenticated with " << event.data["method"].get<std::string>() << "\n";
        });

        client.on(EventType::Reconnecting, [](const ClientEvent& event) {
            std::cout << "Reconnecting in " << event.data["delay_ms"].get<int64_t>() << "ms\n";
        });

        client.on(EventType::MaxReconnectAttemptsReached, [](const ClientEvent&) {
            std::cerr << "Connection lost for good, giving up\n";
        });

        client.connect();

        while (client.state() != ConnectionState::Ready && client.state() != ConnectionState::Disconnected) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << client.get_connection_status().dump(2) << "\n";

        client.disconnect();
        scheduler.stop();

    } catch (const ValidationError& e) {
        std::cerr << "Invalid " << e.field() << ": " << e.what() << "\n";
        return 1;
    } catch (const PulseWireError& e) {
        std::cerr << "PulseWire Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
