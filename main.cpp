/**
 * @file main.cpp
 * @brief Seat Heat Controller - Main Entry Point
 *
 * Usage: seat_heat_controller [config.json]
 */

#include <iostream>
#include <csignal>
#include "config_manager.hpp"
#include "system_manager.hpp"

// Global Variables
static SystemManager* g_system_manager = nullptr;

// Signal Handler
void SignalHandler(int signal) {
    (void)signal;
    if (g_system_manager) {
        g_system_manager->stop();
    }
}

// Main Entry Point
int main(int argc, char* argv[]) {
    const char* config_file = argc > 1 ? argv[1] : "config.json";

    // Load config
    ConfigManager config(config_file);
    if (!config.load()) {
        std::cerr << "[ERROR] Failed to load config\n";
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    // Initialize system
    SystemManager system(config);
    g_system_manager = &system;

    if (!system.initialize()) {
        std::cerr << "[ERROR] Initialization failed\n";
        g_system_manager = nullptr;
        return 1;
    }

    // Main loop
    system.runDaemon();

    // Shutdown
    system.shutdown();
    g_system_manager = nullptr;
    return 0;
}
