// main.cpp
#include "system/system_manager.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace PredictionTrader::System;

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    try {
        std::string config_directory = argc > 1 ? argv[1] : "config";

        // Initialize system - handles all setup (config loading, logging, etc.)
        SystemInitializationResult initialization_result = initialize(config_directory);

        SystemThreads thread_handles;
        startup(*initialization_result.system_state, initialization_result.logger, thread_handles);

        try {
            run(*initialization_result.system_state);
        } catch (const std::exception&) {
            // Drain and join the logger before reporting
            shutdown(*initialization_result.system_state, initialization_result.logger, thread_handles);
            throw;
        }

        shutdown(*initialization_result.system_state, initialization_result.logger, thread_handles);

        return 0;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
