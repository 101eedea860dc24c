#include "BookingApp.hpp"
#include <iostream>
#include <csignal>
#include <signal.h>

// Global pointer for signal handler
booking::BookingApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        booking::BookingApp app;
        g_app = &app;

        // Без SA_RESTART: сигнал прерывает чтение stdin, и цикл запросов завершается
        struct sigaction action {};
        action.sa_handler = signalHandler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        std::cout << "========================================" << std::endl;
        std::cout << "  Booking Service v1.0.0 Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        int code = app.run(argc, argv);

        app.shutdown();
        g_app = nullptr;
        std::cout << "[main] Booking Service stopped" << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
