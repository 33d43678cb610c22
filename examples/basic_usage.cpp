/**
 * @file basic_usage.cpp
 * @brief Basic usage example for PulseWire
 */

#include <pulsewire/pulsewire.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using namespace pulsewire;

int main(int argc, char** argv) {
    std::cout << "PulseWire - Basic Usage Example\n\n";

    try {
        // Options from a JSON file when given, defaults otherwise
        ClientOptions options = argc > 1 ? load_client_options(argv[1]) : ClientOptions{};
        if (argc <= 1) {
            apply_environment_overrides(options);
        }

        ThreadScheduler scheduler;
        RuntimeContext context(scheduler, make_logger("pulsewire", options.log_level));

        auto transport = std::make_shared<WebSocketTransport>(context.logger("ws"));
        auto store = std::make_shared<FileSessionStore>(options.session_dir);

        ClientRuntime client(options, transport, store, context);

        client.on(EventType::QrGenerated, [](const ClientEvent& event) {
            std::cout << "Scan this QR payload with your phone:\n  "
                      << event.data["data"].get<std::string>() << "\n";
        });

        client.on(EventType::Ready, [](const ClientEvent&) {
            std::cout << "Client is ready\n";
        });

        client.on(EventType::OperationSent, [](const ClientEvent& event) {
            std::cout << "Sent operation " << event.data["id"].get<std::string>() << "\n";
        });

        client.on(EventType::Error, [](const ClientEvent& event) {
            std::cerr << "Error: " << event.data.value("message", "") << "\n";
        });

        std::cout << "Connecting to " << options.server_url << "...\n";
        client.connect();

        // Wait for authentication to finish
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.auth_timeout_ms);
        while (client.state() != ConnectionState::Ready && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (client.state() != ConnectionState::Ready) {
            std::cerr << "Not authenticated in time\n";
            return 1;
        }

        // Queue a few operations at different priorities
        client.enqueue_operation({{"type", "text"}, {"to", "15551234567"}, {"body", "Hello from PulseWire"}}, 1);
        client.enqueue_operation({{"type", "text"}, {"to", "15551234567"}, {"body", "Low priority note"}}, 5);

        std::this_thread::sleep_for(std::chrono::seconds(2));

        std::cout << "\nStatus:\n" << client.get_connection_status().dump(2) << "\n";

        // Clean up
        std::cout << "\nDisconnecting...\n";
        client.disconnect();
        scheduler.stop();
        std::cout << "Done!\n";

    } catch (const PulseWireError& e) {
        std::cerr << "PulseWire Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
