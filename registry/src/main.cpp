#include "RegistryApp.hpp"
#include "domain/errors/RegistryException.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        registry::RegistryApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Entity Registry Check v1.0.0" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int code = app.run(argc, argv);

        std::cout << "[main] Registry check finished with code " << code << std::endl;
        return code;

    } catch (const registry::domain::CorruptStateError& e) {
        std::cerr << "[main] Corrupt registry: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
