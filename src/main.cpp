#include "server_config.hpp"
#include "web_server.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <signal.h>

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
}

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        printUsage(argv[0]);
        return 0;
    }

    applyEnvironment(config);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        std::cout << "=== Interview Proctor Service ===" << std::endl;
        std::cout << "Port: " << config.port << std::endl;
        std::cout << "Upload root: " << config.upload_root << std::endl;
        std::cout << "Face detector: " << config.detector << std::endl;
        std::cout << "Analysis workers: " << config.analysis_threads
                  << " (queue " << config.analysis_queue << ")" << std::endl;
        std::cout << "Registry capacity: " << config.registry_capacity << std::endl;
        std::cout << "=================================" << std::endl;

        global_server = std::make_unique<WebServer>();

        if (!global_server->initialize(config)) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        std::cout << "\nServer ready! Available endpoints:" << std::endl;
        std::cout << "  GET  /health                 - Health check" << std::endl;
        std::cout << "  POST /contexts               - Register a job-match context" << std::endl;
        std::cout << "  POST /interview/start        - Start or resume an interview" << std::endl;
        std::cout << "  POST /interview/answer       - Submit an answer" << std::endl;
        std::cout << "  POST /proctor/frame          - Submit a webcam frame" << std::endl;
        std::cout << "  GET  /hr/proctoring/<id>     - Proctoring timeline" << std::endl;
        std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

        // Blocks until stop()
        global_server->start();
        global_server.reset();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
