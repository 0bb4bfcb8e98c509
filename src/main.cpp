/*
 * liverun - Interactive code execution with live output
 * Streams stdout/stderr over WebSocket channels and feeds user input to stdin
 */

#include "channel_hub.h"
#include "config.h"
#include "dataset_stager.h"
#include "execution_engine.h"
#include "http_server.h"
#include "input_classifier.h"
#include "protocol.h"
#include "service_routes.h"
#include <pthread.h>
#include <signal.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace liverun;

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    // Handle SIGINT/SIGTERM on a dedicated thread; every other thread
    // inherits the blocked mask
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    std::cout << "liverun - Interactive Code Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Interpreter:       " << config.interpreter << std::endl;
    std::cout << "Container runtime: " << config.container_runtime
              << " (" << config.container_image << ")" << std::endl;
    std::cout << "Dataset root:      " << config.dataset_root << std::endl;
    std::cout << "Timeouts:          default " << config.default_timeout_seconds
              << "s, max " << config.max_timeout_seconds << "s" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    ChannelHub hub;
    ExecutionEngine engine(config.engine_config(), hub,
                           std::make_unique<PythonInputClassifier>(),
                           std::make_unique<DirectoryDatasetStager>(config.dataset_root));
    SubmissionDispatcher dispatcher(engine);

    HttpServer server(config.port);

    install_routes(server, hub, engine, dispatcher);

    try {
        server.listen();
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  GET  /                - Service info" << std::endl;
    std::cout << "  GET  /health          - Health and active executions" << std::endl;
    std::cout << "  POST /run_code        - Start a run (or feed input)" << std::endl;
    std::cout << "  POST /provide_input   - Feed an input line" << std::endl;
    std::cout << "  WS   /channel/{id}    - Live events; submit runs as text frames" << std::endl;
    std::cout << std::endl;

    std::atomic<bool> signalled{false};
    std::thread signal_thread([&]() {
        int signal_number = 0;
        sigwait(&shutdown_signals, &signal_number);
        if (!signalled.exchange(true)) {
            std::cout << "[Server] Received signal " << signal_number << ", stopping" << std::endl;
        }
        server.stop();
    });

    server.serve();

    // Wake the signal thread if the accept loop ended on its own
    if (!signalled.exchange(true)) {
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    server.stop();
    engine.shutdown();
    std::cout << "[Server] Stopped" << std::endl;
    return 0;
}
