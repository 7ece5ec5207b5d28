#include "TaskLedgerHttpServer.hpp"
#include <cstdlib>
#include <iostream>

int main() {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string dataDir = "data";
    if (const char* envHost = std::getenv("TASKLEDGER_HOST")) host = envHost;
    if (const char* envPort = std::getenv("TASKLEDGER_PORT")) {
        try { port = std::stoi(envPort); } catch (const std::exception&) {
            std::cerr << "Ignoring invalid TASKLEDGER_PORT=" << envPort << "\n";
        }
    }
    if (const char* envDir = std::getenv("TASKLEDGER_DATA_DIR")) dataDir = envDir;

    try {
        TaskLedgerHttpServer app(host, port, dataDir);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
